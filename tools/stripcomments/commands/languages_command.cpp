#include "languages_command.hpp"

#include <iomanip>
#include <nlohmann/json.hpp>

namespace decomment::cli {

using json = nlohmann::json;

void LanguagesCommand::setup(CLI::App& app) {
    auto* long_flag = app.add_flag("--long", long_, "Show comment delimiters and file extensions");
    auto* json_flag = app.add_flag("--json", json_, "Output as JSON");
    long_flag->excludes(json_flag);
}

int LanguagesCommand::execute(CommandContext& ctx) {
    const auto& languages = PatternRegistry::list_languages();
    ctx.logger->debug(std::to_string(languages.size()) + " language(s) registered");

    if (json_) {
        print_json(*ctx.out);
    } else if (long_) {
        print_table(*ctx.out);
    } else {
        for (const auto& name : languages) {
            *ctx.out << name << "\n";
        }
    }

    return DECOMMENT_EXIT_SUCCESS;
}

void LanguagesCommand::print_table(std::ostream& out) const {
    out << std::left
              << std::setw(32) << "LANGUAGE"
              << std::setw(8) << "LINE"
              << std::setw(20) << "BLOCK"
              << "EXTENSIONS\n";
    out << std::string(80, '-') << "\n";

    for (const auto& name : PatternRegistry::list_languages()) {
        auto profile = PatternRegistry::language_profile(name);
        if (!profile.ok()) {
            continue;
        }

        std::vector<std::string> blocks;
        for (const auto& pair : profile->block_comments) {
            blocks.push_back(pair.open + " " + pair.close);
        }

        out << std::left
                  << std::setw(32) << name
                  << std::setw(8) << profile->line_comment.value_or("-")
                  << std::setw(20) << (blocks.empty() ? "-" : join(blocks, ", "))
                  << join(PatternRegistry::extensions_for(name), " ") << "\n";
    }
}

void LanguagesCommand::print_json(std::ostream& out) const {
    json languages = json::array();

    for (const auto& name : PatternRegistry::list_languages()) {
        auto profile = PatternRegistry::language_profile(name);
        if (!profile.ok()) {
            continue;
        }

        json blocks = json::array();
        for (const auto& pair : profile->block_comments) {
            blocks.push_back({{"open", pair.open}, {"close", pair.close}});
        }

        json entry;
        entry["name"] = name;
        entry["line_comment"] = profile->line_comment
            ? json(*profile->line_comment)
            : json(nullptr);
        entry["block_comments"] = blocks;
        entry["extensions"] = PatternRegistry::extensions_for(name);
        languages.push_back(entry);
    }

    out << languages.dump(2) << "\n";
}

}  // namespace decomment::cli
