#pragma once

#include <spiral/dictionary.hpp>
#include <spiral/frequency_model.hpp>
#include <spiral/types.hpp>

#include <string_view>

namespace spiral {

/**
 * Frequency-based evidence for candidate tokens.
 *
 * score() is the corpus frequency with low counts floored to zero.
 * rescale() normalizes a score before it is compared against a split
 * threshold: single characters get nothing, short dictionary words get a
 * square root, everything else the 2.5th root.
 *
 * The model and dictionary are borrowed and must outlive this object.
 */
class ScoringModel {
public:
    ScoringModel(const FrequencyModel& frequencies,
                 const DictionaryOracle& dictionary,
                 SplitterConfig config = {});

    double score(std::string_view token) const;
    double rescale(std::string_view token, double score) const;

    bool is_word(std::string_view token) const {
        return dictionary_.is_word(token);
    }

    const SplitterConfig& config() const { return config_; }

private:
    const FrequencyModel& frequencies_;
    const DictionaryOracle& dictionary_;
    SplitterConfig config_;
};

}  // namespace spiral
