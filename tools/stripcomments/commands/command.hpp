#pragma once

#include <decomment/decomment.hpp>
#include <decomment/util/file_io.hpp>
#include <decomment/util/logger.hpp>
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace decomment::cli {

// Logger used until the shell installs a console logger
inline Logger& null_logger() {
    static NullLogger logger;
    return logger;
}

/**
 * Context passed to command execution.
 * Contains shared resources like the logger and the standard streams.
 */
struct CommandContext {
    Config config;
    Logger* logger = &null_logger();
    std::istream* in = &std::cin;
    std::ostream* out = &std::cout;
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
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with logger and settings
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;
};

// Join strings with a separator, e.g. for extension lists
inline std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += sep;
        result += items[i];
    }
    return result;
}

}  // namespace decomment::cli
