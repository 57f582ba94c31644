#pragma once

#include "command.hpp"
#include "exit_codes.hpp"
#include <string>
#include <vector>

namespace spiral::cli {

/**
 * Show the evidence the splitter sees for individual tokens: raw score,
 * rescaled score, dictionary and affix membership.
 */
class ScoreCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "score"; }
    std::string description() const override {
        return "Show scores for tokens";
    }

private:
    std::vector<std::string> tokens_;
};

}  // namespace spiral::cli
