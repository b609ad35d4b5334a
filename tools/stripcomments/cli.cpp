#include "cli.hpp"
#include "commands/command.hpp"
#include "commands/detect_command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/languages_command.hpp"
#include "commands/strip_command.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <utility>

#ifndef DECOMMENT_VERSION
#define DECOMMENT_VERSION "0.0.0"
#endif

namespace decomment::cli {

bool needs_default_command(const std::vector<std::string>& args,
                           const std::vector<std::string>& command_names) {
    // Global flags may come before the command name
    auto first_it = std::find_if(args.begin(), args.end(), [](const std::string& arg) {
        return arg != "-v" && arg != "--verbose";
    });
    if (first_it == args.end()) {
        return false;
    }

    const std::string& first = *first_it;
    if (first == "-h" || first == "--help" || first == "--version") {
        return false;
    }

    return std::find(command_names.begin(), command_names.end(), first) == command_names.end();
}

int run(std::vector<std::string> args, std::istream& in, std::ostream& out, std::ostream& err) {
    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<StripCommand>());
    commands.push_back(std::make_unique<LanguagesCommand>());
    commands.push_back(std::make_unique<DetectCommand>());

    CLI::App app{"stripcomments - remove comments from source code"};
    app.set_version_flag("--version", DECOMMENT_VERSION);
    app.require_subcommand(1);
    // Lets -v be given after the command name
    app.fallthrough();

    CommandContext ctx;
    ctx.in = &in;
    ctx.out = &out;
    app.add_flag("-v,--verbose", ctx.config.verbose, "Print status messages to stderr");

    std::vector<std::string> names;
    std::vector<std::pair<CLI::App*, Command*>> registered;
    for (auto& cmd : commands) {
        CLI::App* sub = app.add_subcommand(cmd->name(), cmd->description());
        cmd->setup(*sub);
        registered.emplace_back(sub, cmd.get());
        names.push_back(cmd->name());
    }

    if (needs_default_command(args, names)) {
        args.insert(args.begin(), "strip");
    }

    try {
        // CLI11 consumes the vector from the back
        std::reverse(args.begin(), args.end());
        app.parse(args);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, out, err);
    }

    ConsoleLogger logger(err);
    logger.set_min_level(ctx.config.verbose ? LogLevel::DEBUG : LogLevel::WARNING);
    ctx.logger = &logger;

    for (auto& [sub, cmd] : registered) {
        if (!sub->parsed()) {
            continue;
        }
        try {
            return cmd->execute(ctx);
        } catch (const std::exception& e) {
            logger.error(std::string("Internal error: ") + e.what());
            return DECOMMENT_EXIT_INTERNAL;
        }
    }

    return DECOMMENT_EXIT_USER_ERROR;
}

}  // namespace decomment::cli
