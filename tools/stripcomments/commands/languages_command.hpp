#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace decomment::cli {

/**
 * List supported language identifiers.
 *
 * Plain output is one identifier per line, suitable for populating a
 * selector; --json also describes delimiters and extensions.
 */
class LanguagesCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "languages"; }
    std::string description() const override {
        return "List supported languages";
    }

private:
    void print_table(std::ostream& out) const;
    void print_json(std::ostream& out) const;

    bool long_ = false;
    bool json_ = false;
};

}  // namespace decomment::cli
