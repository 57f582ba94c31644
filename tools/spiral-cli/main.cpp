#include "commands/command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/score_command.hpp"
#include "commands/split_command.hpp"

#include <spiral/spiral.hpp>
#include <spiral/util/logger.hpp>

#include <CLI/CLI.hpp>

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

// Word list used when no dictionary is given
const char* DEFAULT_WORD_LIST = "/usr/share/dict/words";

struct GlobalOptions {
    std::string frequencies_path;
    std::string dictionary_path;
    std::string log_level = "info";
};

}  // namespace

int main(int argc, char* argv[]) {
    using namespace spiral;
    using namespace spiral::cli;

    CLI::App app{"spiral - split program identifiers into words"};
    app.require_subcommand(1);
    app.fallthrough();

    GlobalOptions options;
    app.add_option("-f,--frequencies", options.frequencies_path,
                   "Token frequency file (.json or whitespace-separated; "
                   "default: $SPIRAL_FREQUENCIES)")
        ->type_name("<file>");
    app.add_option("-d,--dictionary", options.dictionary_path,
                   "Word list, one word per line (default: $SPIRAL_DICTIONARY)")
        ->type_name("<file>");
    app.add_option("-L,--log-level", options.log_level,
                   "Logging level: debug, info, warning or error (default: info)")
        ->type_name("<level>");

    std::vector<std::pair<CLI::App*, std::unique_ptr<Command>>> commands;
    auto add_command = [&app, &commands](std::unique_ptr<Command> command) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        commands.emplace_back(sub, std::move(command));
    };
    add_command(std::make_unique<SplitCommand>());
    add_command(std::make_unique<ScoreCommand>());

    CLI11_PARSE(app, argc, argv);

    auto level = parse_log_level(options.log_level);
    if (!level) {
        std::cerr << "Error: unknown log level: " << options.log_level << "\n";
        return SPIRAL_EXIT_USER_ERROR;
    }
    ConsoleLogger logger;
    logger.set_min_level(*level);
    logger.debug(std::string("log level: ") + log_level_name(*level));

    auto frequencies_path = resolve_data_path(options.frequencies_path, "SPIRAL_FREQUENCIES");
    if (!frequencies_path) {
        std::cerr << "Error: no frequency file; use --frequencies or set SPIRAL_FREQUENCIES\n";
        return SPIRAL_EXIT_USER_ERROR;
    }

    auto frequencies = FrequencyTable::load(*frequencies_path);
    if (!frequencies.ok()) {
        std::cerr << "Error: " << frequencies.error().to_string() << "\n";
        return SPIRAL_EXIT_IO_ERROR;
    }
    logger.info("loaded " + std::to_string(frequencies.value().size()) +
                " token frequencies from " + frequencies_path->string());

    WordListDictionary dictionary;
    auto dictionary_path = resolve_data_path(options.dictionary_path, "SPIRAL_DICTIONARY");
    if (!dictionary_path && std::filesystem::exists(DEFAULT_WORD_LIST)) {
        dictionary_path = DEFAULT_WORD_LIST;
    }
    if (dictionary_path) {
        auto loaded = WordListDictionary::load(*dictionary_path);
        if (!loaded.ok()) {
            std::cerr << "Error: " << loaded.error().to_string() << "\n";
            return SPIRAL_EXIT_IO_ERROR;
        }
        dictionary = std::move(loaded.value());
        logger.info("loaded " + std::to_string(dictionary.size()) +
                    " dictionary words from " + dictionary_path->string());
    } else {
        logger.warning("no dictionary available; dictionary checks will always fail");
    }

    CommandContext ctx;
    ctx.frequencies = &frequencies.value();
    ctx.dictionary = &dictionary;
    ctx.logger = &logger;

    try {
        for (auto& [sub, command] : commands) {
            if (sub->parsed()) {
                return command->execute(ctx);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return SPIRAL_EXIT_INTERNAL;
    }

    std::cerr << "Run 'spiral --help' for available commands.\n";
    return SPIRAL_EXIT_USER_ERROR;
}
