#pragma once

#include <spiral/affix_tables.hpp>
#include <spiral/scoring_model.hpp>
#include <spiral/types.hpp>
#include <spiral/util/logger.hpp>

#include <string>
#include <unordered_map>

namespace spiral {

/**
 * Recursive cut search over a token with no usable case boundary.
 *
 * Every cut index is scored. A cut where both halves clear the threshold
 * competes on the sum of their raw scores (case 1). A cut where only the
 * left half clears it recurses on the right half and, when that recursion
 * splits, replaces whatever was recorded before (case 2). Cuts that strand a
 * known prefix on the left or a known suffix on the right are skipped.
 *
 * Dictionary words and single characters are returned unsplit.
 *
 * Results for right halves are cached for the duration of one public call,
 * so a run of n characters is solved once per suffix instead of once per
 * path through the cut tree.
 */
class SameCaseSplitter {
public:
    SameCaseSplitter(const ScoringModel& scoring, Logger* logger = nullptr);

    Split split(const std::string& token) const;
    Split split(const std::string& token, double score_ns) const;

private:
    // Right half -> its split; score_ns is fixed for the cache's lifetime
    using SplitCache = std::unordered_map<std::string, Split>;

    Split split(const std::string& token, double score_ns, SplitCache& cache) const;

    const ScoringModel& scoring_;
    Logger* logger_;
};

}  // namespace spiral
