#include <spiral/scoring_model.hpp>

#include <cmath>

namespace spiral {

ScoringModel::ScoringModel(const FrequencyModel& frequencies,
                           const DictionaryOracle& dictionary,
                           SplitterConfig config)
    : frequencies_(frequencies),
      dictionary_(dictionary),
      config_(config) {}

double ScoringModel::score(std::string_view token) const {
    double f = frequencies_.frequency(token);
    return f < config_.noise_threshold ? 0.0 : f;
}

double ScoringModel::rescale(std::string_view token, double score) const {
    if (token.size() <= 1) {
        return 0.0;
    }
    if (token.size() <= config_.short_word_length && dictionary_.is_word(token)) {
        return std::pow(score, 1.0 / config_.short_word_exponent);
    }
    return std::pow(score, 1.0 / config_.long_word_exponent);
}

}  // namespace spiral
