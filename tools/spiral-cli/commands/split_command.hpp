#pragma once

#include "command.hpp"
#include "exit_codes.hpp"
#include <string>
#include <vector>

namespace spiral::cli {

/**
 * Split identifiers given on the command line or stdin.
 *
 * Output is one line per identifier: the identifier, a tab, then the
 * tokens separated by spaces. With --json each line is a JSON object.
 */
class SplitCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "split"; }
    std::string description() const override {
        return "Split identifiers into words";
    }

private:
    std::vector<std::string> identifiers_;
    bool from_stdin_ = false;
    bool json_ = false;
    size_t max_length_ = 0;

    void print_result(const std::string& identifier, const Split& tokens) const;
};

}  // namespace spiral::cli
