#pragma once

#include <spiral/case_transition_splitter.hpp>
#include <spiral/dictionary.hpp>
#include <spiral/frequency_model.hpp>
#include <spiral/result.hpp>
#include <spiral/same_case_splitter.hpp>
#include <spiral/scoring_model.hpp>
#include <spiral/simple_splitter.hpp>
#include <spiral/types.hpp>
#include <spiral/util/logger.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace spiral {

/**
 * SamuraiSplitter - identifier splitting driven by corpus frequencies.
 *
 * Pipeline for one identifier:
 * 1. SimpleSplitter cuts at delimiters, digits and lower-to-upper changes
 * 2. CaseTransitionSplitter resolves the first upper-to-lower change in
 *    each segment
 * 3. SameCaseSplitter splits each resulting piece, using the piece's own
 *    score as the threshold floor
 *
 * The frequency model, dictionary and simple splitter are borrowed and must
 * outlive the splitter. All split methods are const and safe to call from
 * several threads when the borrowed collaborators are.
 */
class SamuraiSplitter {
public:
    /**
     * Create a splitter using the default DelimiterSplitter.
     *
     * @param frequencies Corpus frequency model
     * @param dictionary Dictionary oracle
     * @param config Scoring constants and length bound
     * @param logger Optional trace sink (nullptr = silent)
     */
    SamuraiSplitter(const FrequencyModel& frequencies,
                    const DictionaryOracle& dictionary,
                    SplitterConfig config = {},
                    Logger* logger = nullptr);

    // Same, with a caller-provided first-pass splitter
    SamuraiSplitter(const FrequencyModel& frequencies,
                    const DictionaryOracle& dictionary,
                    const SimpleSplitter& simple_splitter,
                    SplitterConfig config = {},
                    Logger* logger = nullptr);

    SamuraiSplitter(const SamuraiSplitter&) = delete;
    SamuraiSplitter& operator=(const SamuraiSplitter&) = delete;

    /**
     * Split an identifier into tokens.
     *
     * @return Tokens in order (empty for an empty identifier), or
     *         INPUT_TOO_LARGE when the identifier exceeds
     *         SplitterConfig::max_identifier_length
     */
    Result<Split> split(std::string_view identifier) const;

    Result<Split> mixed_case_split(std::string_view identifier) const {
        return split(identifier);
    }

    const ScoringModel& scoring() const { return scoring_; }
    const SameCaseSplitter& same_case_splitter() const { return same_case_; }
    const CaseTransitionSplitter& case_transition_splitter() const { return case_transition_; }

private:
    std::unique_ptr<SimpleSplitter> owned_simple_;
    const SimpleSplitter& simple_;
    ScoringModel scoring_;
    SameCaseSplitter same_case_;
    CaseTransitionSplitter case_transition_;
    Logger* logger_;
};

/**
 * One-shot convenience: split with a temporary SamuraiSplitter.
 */
Result<Split> split_identifier(std::string_view identifier,
                               const FrequencyModel& frequencies,
                               const DictionaryOracle& dictionary,
                               SplitterConfig config = {},
                               Logger* logger = nullptr);

}  // namespace spiral
