#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace spiral {

// A token is a run of identifier characters; a split is an ordered list of
// tokens whose concatenation is the text that was split.
using Token = std::string;
using Split = std::vector<Token>;

/**
 * Tunable constants for scoring and splitting.
 */
struct SplitterConfig {
    // Frequencies below this count are treated as noise (score 0)
    double noise_threshold = 30.0;

    // Floor for the split threshold when no score is supplied
    double default_score_ns = 0.0000005;

    // Dictionary words up to this length get the gentler exponent
    size_t short_word_length = 4;
    double short_word_exponent = 2.0;
    double long_word_exponent = 2.5;

    // Identifiers longer than this are rejected by the top-level splitter
    size_t max_identifier_length = 256;

    // Keep digit runs as their own segments instead of dropping them
    bool keep_digits = true;
};

}  // namespace spiral
