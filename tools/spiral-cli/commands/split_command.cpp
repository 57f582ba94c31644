#include "split_command.hpp"
#include <nlohmann/json.hpp>

namespace spiral::cli {

void SplitCommand::setup(CLI::App& app) {
    app.add_option("identifiers", identifiers_, "Identifiers to split")
        ->type_name("<identifier>...");

    app.add_flag("--stdin", from_stdin_, "Read identifiers from stdin, one per line");

    app.add_flag("--json", json_, "Print one JSON object per identifier");

    app.add_option("--max-length", max_length_,
                   "Reject identifiers longer than this (default: 256)")
        ->type_name("<num>");
}

int SplitCommand::execute(CommandContext& ctx) {
    if (from_stdin_) {
        auto lines = read_stdin_lines();
        identifiers_.insert(identifiers_.end(), lines.begin(), lines.end());
    }

    if (identifiers_.empty()) {
        std::cerr << "Usage: spiral split <identifier>... [--json] [--stdin]\n";
        return SPIRAL_EXIT_USER_ERROR;
    }

    SplitterConfig config = ctx.config;
    if (max_length_ > 0) {
        config.max_identifier_length = max_length_;
    }

    SamuraiSplitter splitter(*ctx.frequencies, *ctx.dictionary, config, ctx.logger);

    int exit_code = SPIRAL_EXIT_SUCCESS;
    for (const auto& identifier : identifiers_) {
        auto result = splitter.split(identifier);
        if (!result.ok()) {
            std::cerr << "Error: " << result.error().to_string() << "\n";
            exit_code = SPIRAL_EXIT_USER_ERROR;
            continue;
        }
        print_result(identifier, result.value());
    }

    return exit_code;
}

void SplitCommand::print_result(const std::string& identifier, const Split& tokens) const {
    if (json_) {
        nlohmann::json out;
        out["identifier"] = identifier;
        out["tokens"] = tokens;
        std::cout << out.dump() << "\n";
        return;
    }

    std::cout << identifier << "\t";
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) std::cout << " ";
        std::cout << tokens[i];
    }
    std::cout << "\n";
}

}  // namespace spiral::cli
