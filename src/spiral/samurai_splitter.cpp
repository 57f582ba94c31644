#include <spiral/samurai_splitter.hpp>
#include <spiral/util/text.hpp>

namespace spiral {

SamuraiSplitter::SamuraiSplitter(const FrequencyModel& frequencies,
                                 const DictionaryOracle& dictionary,
                                 SplitterConfig config,
                                 Logger* logger)
    : owned_simple_(std::make_unique<DelimiterSplitter>(config.keep_digits)),
      simple_(*owned_simple_),
      scoring_(frequencies, dictionary, config),
      same_case_(scoring_, logger),
      case_transition_(scoring_, logger),
      logger_(logger ? logger : &null_logger()) {}

SamuraiSplitter::SamuraiSplitter(const FrequencyModel& frequencies,
                                 const DictionaryOracle& dictionary,
                                 const SimpleSplitter& simple_splitter,
                                 SplitterConfig config,
                                 Logger* logger)
    : simple_(simple_splitter),
      scoring_(frequencies, dictionary, config),
      same_case_(scoring_, logger),
      case_transition_(scoring_, logger),
      logger_(logger ? logger : &null_logger()) {}

Result<Split> SamuraiSplitter::split(std::string_view identifier) const {
    const size_t limit = scoring_.config().max_identifier_length;
    if (identifier.size() > limit) {
        return Error(ErrorCode::INPUT_TOO_LARGE,
                     "identifier of length " + std::to_string(identifier.size()) +
                     " exceeds limit of " + std::to_string(limit));
    }

    const bool trace = logger_->enabled(LogLevel::DEBUG);
    if (trace) logger_->debug("splitting " + std::string(identifier));

    Split pieces;
    for (const auto& segment : simple_.split(identifier)) {
        Split parts = case_transition_.split(segment);
        pieces.insert(pieces.end(),
                      std::make_move_iterator(parts.begin()),
                      std::make_move_iterator(parts.end()));
    }

    if (trace) logger_->debug("turning over to same-case split: " + format_tokens(pieces));

    Split results;
    for (const auto& piece : pieces) {
        Split tokens = same_case_.split(piece, scoring_.score(piece));
        results.insert(results.end(),
                       std::make_move_iterator(tokens.begin()),
                       std::make_move_iterator(tokens.end()));
    }

    if (trace) logger_->debug("final results: " + format_tokens(results));
    return results;
}

Result<Split> split_identifier(std::string_view identifier,
                               const FrequencyModel& frequencies,
                               const DictionaryOracle& dictionary,
                               SplitterConfig config,
                               Logger* logger) {
    SamuraiSplitter splitter(frequencies, dictionary, config, logger);
    return splitter.split(identifier);
}

}  // namespace spiral
