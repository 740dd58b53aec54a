#include <langid/langid.hpp>

#include "commands/batch_command.hpp"
#include "commands/detect_command.hpp"
#include "commands/languages_command.hpp"

#include <iostream>
#include <memory>
#include <vector>

namespace {

using namespace langid;
using namespace langid::cli;

// Defaults, then the config file, then LANGID_* environment overrides
Result<DetectorConfig> resolve_config(const std::string& path) {
    DetectorConfig config;
    if (!path.empty()) {
        auto loaded = load_config(path);
        if (!loaded.ok()) {
            return loaded.error();
        }
        config = std::move(loaded.value());
    }

    auto env = apply_env_overrides(config);
    if (!env.ok()) {
        return env.error();
    }
    return config;
}

int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::IO_ERROR:
            return LANGID_EXIT_IO_ERROR;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::PARSE_ERROR:
            return LANGID_EXIT_USER_ERROR;
        default:
            return LANGID_EXIT_INTERNAL;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"langid - identify the language of short texts"};
    app.require_subcommand(1);
    app.fallthrough();

    std::string config_path;
    bool verbose = false;
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->type_name("<file>");
    app.add_flag("-v,--verbose", verbose, "Log detector decisions to stderr");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<DetectCommand>());
    commands.push_back(std::make_unique<BatchCommand>());
    commands.push_back(std::make_unique<LanguagesCommand>());

    std::vector<std::pair<CLI::App*, Command*>> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.emplace_back(sub, command.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Prints help or the parse error; anything but --help is a usage error
        return app.exit(e) == 0 ? LANGID_EXIT_SUCCESS : LANGID_EXIT_USER_ERROR;
    }

    auto config = resolve_config(config_path);
    if (!config.ok()) {
        std::cerr << "Error: " << config.error().to_string() << "\n";
        return exit_code_for(config.error());
    }

    LoggerPtr logger;
    if (verbose) {
        logger = std::make_shared<ConsoleLogger>();
        logger->set_min_level(LogLevel::DEBUG);
    }

    auto detector = HybridDetector::create(config.value(), logger);
    if (!detector.ok()) {
        std::cerr << "Error: " << detector.error().to_string() << "\n";
        return exit_code_for(detector.error());
    }

    CommandContext ctx;
    ctx.detector = detector.value().get();
    ctx.verbose = verbose;

    for (auto& [sub, command] : subcommands) {
        if (sub->parsed()) {
            try {
                return command->execute(ctx);
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return LANGID_EXIT_INTERNAL;
            }
        }
    }

    std::cerr << app.help();
    return LANGID_EXIT_USER_ERROR;
}
