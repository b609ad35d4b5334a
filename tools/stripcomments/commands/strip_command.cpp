#include "strip_command.hpp"

namespace decomment::cli {

void StripCommand::setup(CLI::App& app) {
    app.add_option("input", input_, "Source file to clean")
        ->type_name("<inputfile>");

    app.add_option("-l,--lang", language_, "Language (inferred from extension if omitted)")
        ->type_name("<identifier>")
        ->check(CLI::IsMember(PatternRegistry::list_languages()));

    auto* output = app.add_option("-o,--output", output_, "Write result to this file")
        ->type_name("<outputfile>");

    auto* save = app.add_flag("-s,--save", save_,
                              "Write result next to the input as <name>_nocomments<ext>");

    output->excludes(save);

    auto* stdin_flag = app.add_flag("--stdin", from_stdin_, "Read source from stdin");
    stdin_flag->excludes(save);
}

int StripCommand::execute(CommandContext& ctx) {
    if (from_stdin_ == !input_.empty()) {
        ctx.logger->error("Give either an input file or --stdin");
        return DECOMMENT_EXIT_USER_ERROR;
    }

    std::string content;
    int rc = load_input(ctx, content);
    if (rc != DECOMMENT_EXIT_SUCCESS) {
        return rc;
    }

    if (CommentStripper::is_blank(content)) {
        ctx.logger->error("No code to process.");
        return DECOMMENT_EXIT_USER_ERROR;
    }

    std::string language = resolve_language(ctx);
    ctx.logger->debug("Processing as " + language);

    std::string cleaned = CommentStripper::remove_comments(content, language);
    ctx.logger->info("Comments removed successfully.");

    return write_output(ctx, cleaned);
}

int StripCommand::load_input(CommandContext& ctx, std::string& content) {
    if (from_stdin_) {
        content = read_stream(*ctx.in);
        return DECOMMENT_EXIT_SUCCESS;
    }

    auto result = read_file(input_);
    if (!result.ok()) {
        ctx.logger->error("Error reading file: " + result.error().message());
        return result.error_code() == ErrorCode::NOT_FOUND ? DECOMMENT_EXIT_NOT_FOUND
                                                           : DECOMMENT_EXIT_IO_ERROR;
    }

    content = std::move(result.value());
    ctx.logger->info("File loaded: " + fs::path(input_).filename().string());
    return DECOMMENT_EXIT_SUCCESS;
}

std::string StripCommand::resolve_language(CommandContext& ctx) const {
    if (!language_.empty()) {
        return language_;
    }

    if (from_stdin_) {
        ctx.logger->debug("No --lang given for stdin, using " +
                          PatternRegistry::default_language());
        return PatternRegistry::default_language();
    }

    return PatternRegistry::language_for_extension(input_);
}

int StripCommand::write_output(CommandContext& ctx, const std::string& cleaned) {
    if (output_.empty() && !save_) {
        *ctx.out << cleaned;
        if (!cleaned.empty()) {
            *ctx.out << "\n";
        }
        return DECOMMENT_EXIT_SUCCESS;
    }

    if (cleaned.empty()) {
        ctx.logger->error("No code to save.");
        return DECOMMENT_EXIT_USER_ERROR;
    }

    fs::path target = save_ ? default_output_path(input_) : fs::path(output_);

    auto result = write_file(target, cleaned);
    if (!result.ok()) {
        ctx.logger->error("Error saving file: " + result.error().message());
        return DECOMMENT_EXIT_IO_ERROR;
    }

    ctx.logger->info("File saved: " + target.filename().string());
    return DECOMMENT_EXIT_SUCCESS;
}

}  // namespace decomment::cli
