#include "score_command.hpp"
#include <iomanip>

namespace spiral::cli {

void ScoreCommand::setup(CLI::App& app) {
    app.add_option("tokens", tokens_, "Tokens to score")
        ->type_name("<token>...")
        ->required();
}

int ScoreCommand::execute(CommandContext& ctx) {
    ScoringModel scoring(*ctx.frequencies, *ctx.dictionary, ctx.config);

    std::cout << std::left
              << std::setw(24) << "TOKEN"
              << std::setw(14) << "SCORE"
              << std::setw(14) << "RESCALED"
              << std::setw(6) << "DICT"
              << std::setw(8) << "PREFIX"
              << "SUFFIX\n";
    std::cout << std::string(72, '-') << "\n";

    for (const auto& token : tokens_) {
        double score = scoring.score(token);
        std::cout << std::left
                  << std::setw(24) << token
                  << std::setw(14) << score
                  << std::setw(14) << scoring.rescale(token, score)
                  << std::setw(6) << (scoring.is_word(token) ? "yes" : "no")
                  << std::setw(8) << (AffixTables::is_prefix(token) ? "yes" : "no")
                  << (AffixTables::is_suffix(token) ? "yes" : "no") << "\n";
    }

    return SPIRAL_EXIT_SUCCESS;
}

}  // namespace spiral::cli
