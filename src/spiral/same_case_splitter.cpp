#include <spiral/same_case_splitter.hpp>
#include <spiral/util/text.hpp>

#include <algorithm>
#include <optional>
#include <sstream>

namespace spiral {

SameCaseSplitter::SameCaseSplitter(const ScoringModel& scoring, Logger* logger)
    : scoring_(scoring),
      logger_(logger ? logger : &null_logger()) {}

Split SameCaseSplitter::split(const std::string& token) const {
    return split(token, scoring_.config().default_score_ns);
}

Split SameCaseSplitter::split(const std::string& token, double score_ns) const {
    SplitCache cache;
    return split(token, score_ns, cache);
}

Split SameCaseSplitter::split(const std::string& token, double score_ns,
                              SplitCache& cache) const {
    const bool trace = logger_->enabled(LogLevel::DEBUG);

    if (token.size() < 2) {
        if (trace) logger_->debug("\"" + token + "\" cannot be split; returning as-is");
        return {token};
    }
    if (scoring_.is_word(token)) {
        if (trace) logger_->debug("\"" + token + "\" is a dictionary word; returning as-is");
        return {token};
    }

    auto cached = cache.find(token);
    if (cached != cache.end()) {
        if (trace) logger_->debug("\"" + token + "\" already split: " + format_tokens(cached->second));
        return cached->second;
    }

    const size_t n = token.size();
    const double threshold = std::max(scoring_.score(token), score_ns);
    double max_score = -1;
    std::optional<Split> best;

    if (trace) {
        std::ostringstream ss;
        ss << "threshold score = " << threshold;
        logger_->debug(ss.str());
    }

    // The cut at n leaves an empty right half and the whole token on the
    // left, which can never exceed its own threshold, so it is not scanned.
    for (size_t i = 0; i < n; ++i) {
        std::string left = token.substr(0, i);
        std::string right = token.substr(i);

        double score_l = scoring_.score(left);
        double score_r = scoring_.score(right);
        double rescaled_l = scoring_.rescale(left, score_l);
        double rescaled_r = scoring_.rescale(right, score_r);

        bool is_affix = AffixTables::is_prefix(left) || AffixTables::is_suffix(right);
        bool to_split_l = rescaled_l > threshold;
        bool to_split_r = rescaled_r > threshold;

        if (trace) {
            std::ostringstream ss;
            ss << "|" << left << " : " << right << "| l = " << rescaled_l
               << " r = " << rescaled_r
               << " split_l = " << to_split_l << " split_r = " << to_split_r
               << " affix = " << is_affix << " threshold = " << threshold
               << " max_score = " << max_score;
            logger_->debug(ss.str());
        }

        if (is_affix || !to_split_l) {
            continue;
        }

        if (to_split_r) {
            // Case 1: both halves stand alone; keep the best-scoring cut
            if (score_l + score_r > max_score) {
                max_score = score_l + score_r;
                best = Split{left, right};
                if (trace) logger_->debug("case 1 split result: " + format_tokens(*best));
            } else if (trace) {
                logger_->debug("no split for case 1");
            }
        } else {
            // Case 2: only the left half stands alone; try splitting the rest.
            // A successful recursion replaces any earlier result.
            if (trace) logger_->debug("case 2: recursive call on \"" + right + "\"");
            Split rest = split(right, score_ns, cache);
            if (rest.front() != right) {
                Split candidate;
                candidate.reserve(rest.size() + 1);
                candidate.push_back(left);
                candidate.insert(candidate.end(),
                                 std::make_move_iterator(rest.begin()),
                                 std::make_move_iterator(rest.end()));
                best = std::move(candidate);
                if (trace) logger_->debug("case 2 split result: " + format_tokens(*best));
            } else if (trace) {
                logger_->debug("no split for case 2");
            }
        }
    }

    Split result = best ? std::move(*best) : Split{token};
    if (trace) logger_->debug("<-- returning " + format_tokens(result));
    cache.emplace(token, result);
    return result;
}

}  // namespace spiral
