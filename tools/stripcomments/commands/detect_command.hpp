#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace decomment::cli {

/**
 * Print the language inferred from a filename's extension.
 */
class DetectCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "detect"; }
    std::string description() const override {
        return "Show the language inferred from a filename";
    }

private:
    std::string filename_;
};

}  // namespace decomment::cli
