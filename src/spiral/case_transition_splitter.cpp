#include <spiral/case_transition_splitter.hpp>
#include <spiral/util/text.hpp>

#include <sstream>

namespace spiral {

CaseTransitionSplitter::CaseTransitionSplitter(const ScoringModel& scoring, Logger* logger)
    : scoring_(scoring),
      logger_(logger ? logger : &null_logger()) {}

std::optional<size_t> CaseTransitionSplitter::find_transition(std::string_view segment) {
    for (size_t i = 0; i + 1 < segment.size(); ++i) {
        if (is_upper(segment[i]) && is_lower(segment[i + 1])) {
            return i;
        }
    }
    return std::nullopt;
}

Split CaseTransitionSplitter::split(const std::string& segment) const {
    const bool trace = logger_->enabled(LogLevel::DEBUG);

    auto transition = find_transition(segment);
    if (!transition) {
        if (trace) logger_->debug("no upper-to-lower case transition in " + segment);
        return {segment};
    }

    const size_t i = *transition;
    if (trace) logger_->debug(std::string("case transition: ") + segment[i] + segment[i + 1]);

    // Score with the capital attached to what follows it
    std::string camel = i > 0 ? segment.substr(i) : segment;
    double camel_score = scoring_.score(camel);

    // Score of what follows, without the capital
    std::string alt = segment.substr(i + 1);
    double alt_score = scoring_.rescale(alt, scoring_.score(alt));

    if (trace) {
        std::ostringstream ss;
        ss << "\"" << camel << "\" score " << camel_score
           << ", \"" << alt << "\" rescaled alt score " << alt_score;
        logger_->debug(ss.str());
    }

    Split parts;
    if (camel_score > alt_score) {
        if (trace) logger_->debug("better to include uppercase letter");
        if (i > 0) {
            parts = {segment.substr(0, i), segment.substr(i)};
        } else {
            parts = {segment};
        }
    } else {
        if (trace) logger_->debug("not better to include uppercase letter");
        parts = {segment.substr(0, i + 1), alt};
    }

    if (trace) logger_->debug("split outcome: " + format_tokens(parts));
    return parts;
}

}  // namespace spiral
