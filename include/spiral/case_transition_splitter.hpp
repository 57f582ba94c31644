#pragma once

#include <spiral/scoring_model.hpp>
#include <spiral/types.hpp>
#include <spiral/util/logger.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace spiral {

/**
 * Decides where the first upper-to-lower case transition in a segment cuts.
 *
 * For "GPSmodule" the capital 'S' either starts the next word ("Smodule")
 * or ends the previous one ("GPS" + "module"). The score of the text starting
 * at the capital is compared with the rescaled score of the text after it.
 *
 * Only the first transition is examined; at most one cut is made.
 */
class CaseTransitionSplitter {
public:
    CaseTransitionSplitter(const ScoringModel& scoring, Logger* logger = nullptr);

    Split split(const std::string& segment) const;

    // Index of the first [A-Z][a-z] pair, if any
    static std::optional<size_t> find_transition(std::string_view segment);

private:
    const ScoringModel& scoring_;
    Logger* logger_;
};

}  // namespace spiral
