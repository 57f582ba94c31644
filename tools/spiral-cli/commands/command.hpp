#pragma once

#include <spiral/spiral.hpp>
#include <spiral/util/logger.hpp>
#include <spiral/util/text.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spiral::cli {

/**
 * Context passed to command execution.
 * Holds the loaded frequency model and dictionary.
 */
struct CommandContext {
    const FrequencyModel* frequencies = nullptr;
    const DictionaryOracle* dictionary = nullptr;
    Logger* logger = nullptr;
    SplitterConfig config;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing and data loading succeed.
     *
     * @param ctx Execution context with models and settings
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Resolve a data file path from an option value, falling back to an
 * environment variable. Returns nullopt when neither is set.
 */
inline std::optional<std::filesystem::path> resolve_data_path(
    const std::string& option_value,
    const char* env_var
) {
    if (!option_value.empty()) {
        return std::filesystem::path(option_value);
    }
    const char* value = std::getenv(env_var);
    if (value && value[0] != '\0') {
        return std::filesystem::path(value);
    }
    return std::nullopt;
}

/**
 * Read identifiers from stdin, one per line, skipping blank lines.
 */
inline std::vector<std::string> read_stdin_lines() {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(std::cin, line)) {
        auto trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.emplace_back(trimmed);
        }
    }
    return lines;
}

}  // namespace spiral::cli
