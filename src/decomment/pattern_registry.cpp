#include <decomment/pattern_registry.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>
#include <utility>

namespace decomment {

namespace {

const std::string C_FAMILY = "C/C++/Java/C#/JavaScript/Rust";

// Registration order is the order shown to users
const std::vector<LanguageProfile> PROFILES = {
    {"Python", std::string("#"), {{"\"\"\"", "\"\"\""}, {"'''", "'''"}}},
    {C_FAMILY, std::string("//"), {{"/*", "*/"}}},
    {"HTML/XML", std::nullopt, {{"<!--", "-->"}}},
    {"SQL", std::string("--"), {{"/*", "*/"}}},
    {"Lua", std::string("--"), {{"--[[", "]]"}}},
};

// Extension to language mapping, kept as a list so that
// extensions_for() can report them in a stable order
const std::vector<std::pair<std::string, std::string>> EXTENSIONS = {
    // Python
    {".py", "Python"},
    {".pyw", "Python"},

    // C family
    {".c", C_FAMILY},
    {".cpp", C_FAMILY},
    {".h", C_FAMILY},
    {".hpp", C_FAMILY},
    {".java", C_FAMILY},
    {".cs", C_FAMILY},
    {".js", C_FAMILY},
    {".ts", C_FAMILY},
    {".rs", C_FAMILY},

    // Markup
    {".html", "HTML/XML"},
    {".htm", "HTML/XML"},
    {".xml", "HTML/XML"},

    {".sql", "SQL"},
    {".lua", "Lua"},
};

const std::unordered_map<std::string, std::string>& extension_map() {
    static const std::unordered_map<std::string, std::string> map(
        EXTENSIONS.begin(), EXTENSIONS.end());
    return map;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

}  // namespace

Result<LanguageProfile> PatternRegistry::language_profile(const std::string& identifier) {
    const LanguageProfile* profile = find(identifier);
    if (!profile) {
        return Error(ErrorCode::UNKNOWN_LANGUAGE, "Unknown language: " + identifier);
    }
    return *profile;
}

const std::vector<std::string>& PatternRegistry::list_languages() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> result;
        result.reserve(PROFILES.size());
        for (const auto& profile : PROFILES) {
            result.push_back(profile.name);
        }
        return result;
    }();
    return names;
}

bool PatternRegistry::has_language(const std::string& identifier) {
    return find(identifier) != nullptr;
}

std::string PatternRegistry::language_for_extension(const std::string& filename) {
    std::string ext = extension_of(filename);
    if (ext.empty()) {
        return default_language();
    }

    const auto& map = extension_map();
    auto it = map.find(ext);
    if (it != map.end()) {
        return it->second;
    }

    return default_language();
}

std::vector<std::string> PatternRegistry::extensions_for(const std::string& identifier) {
    std::vector<std::string> result;
    for (const auto& [ext, language] : EXTENSIONS) {
        if (language == identifier) {
            result.push_back(ext);
        }
    }
    return result;
}

const std::string& PatternRegistry::default_language() {
    static const std::string name = DEFAULT_LANGUAGE;
    return name;
}

const std::vector<std::pair<std::string, std::string>>& PatternRegistry::extension_table() {
    return EXTENSIONS;
}

const LanguageProfile* PatternRegistry::find(const std::string& identifier) {
    auto it = std::find_if(PROFILES.begin(), PROFILES.end(),
                           [&](const LanguageProfile& p) { return p.name == identifier; });
    return it == PROFILES.end() ? nullptr : &*it;
}

std::string PatternRegistry::extension_of(const std::string& filename) {
    if (filename.empty()) {
        return "";
    }

    // path::extension() ignores a leading dot, so ".bashrc" has none
    return to_lower(std::filesystem::path(filename).extension().string());
}

}  // namespace decomment
