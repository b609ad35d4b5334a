#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace decomment::cli {

/**
 * Remove comments from a file or stdin.
 *
 * Output goes to stdout unless -o or --save is given.
 */
class StripCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "strip"; }
    std::string description() const override {
        return "Remove comments from a source file (default command)";
    }

private:
    int load_input(CommandContext& ctx, std::string& content);
    int write_output(CommandContext& ctx, const std::string& cleaned);
    std::string resolve_language(CommandContext& ctx) const;

    std::string input_;
    std::string language_;
    std::string output_;
    bool from_stdin_ = false;
    bool save_ = false;
};

}  // namespace decomment::cli
