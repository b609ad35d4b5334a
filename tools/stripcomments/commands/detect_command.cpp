#include "detect_command.hpp"

namespace decomment::cli {

void DetectCommand::setup(CLI::App& app) {
    app.add_option("filename", filename_, "File name or path (need not exist)")
        ->required()
        ->type_name("<filename>");
}

int DetectCommand::execute(CommandContext& ctx) {
    std::string language = PatternRegistry::language_for_extension(filename_);
    ctx.logger->debug("Inferred " + language + " for " + filename_);
    *ctx.out << language << "\n";
    return DECOMMENT_EXIT_SUCCESS;
}

}  // namespace decomment::cli
