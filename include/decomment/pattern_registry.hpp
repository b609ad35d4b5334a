#pragma once

#include <decomment/result.hpp>
#include <decomment/types.hpp>

#include <string>
#include <utility>
#include <vector>

namespace decomment {

/**
 * Read-only table of comment syntax per language, plus the mapping from
 * file extensions to language identifiers.
 *
 * The tables are built once on first use and never modified afterwards,
 * so every query is safe to call from multiple threads.
 */
class PatternRegistry {
public:
    /**
     * Look up the comment syntax of a language.
     *
     * @param identifier Language identifier, e.g. "SQL"
     * @return The profile, or UNKNOWN_LANGUAGE if not registered
     */
    static Result<LanguageProfile> language_profile(const std::string& identifier);

    /**
     * All registered identifiers in registration order.
     */
    static const std::vector<std::string>& list_languages();

    static bool has_language(const std::string& identifier);

    /**
     * Infer the language from a filename or path.
     *
     * The extension is compared case-insensitively. Unmapped extensions
     * and names without an extension give the default language.
     *
     * @param filename File name or path
     * @return Language identifier (never empty)
     */
    static std::string language_for_extension(const std::string& filename);

    /**
     * Extensions (with leading dot) mapped to a language, in registration
     * order. Empty for unknown identifiers.
     */
    static std::vector<std::string> extensions_for(const std::string& identifier);

    static const std::string& default_language();

    // Every (extension, identifier) pair in registration order
    static const std::vector<std::pair<std::string, std::string>>& extension_table();

private:
    static const LanguageProfile* find(const std::string& identifier);
    static std::string extension_of(const std::string& filename);
};

}  // namespace decomment
