#pragma once

#include <decomment/types.hpp>

#include <string>
#include <vector>

namespace decomment {

/**
 * Removes comments from source text using the delimiters registered in
 * PatternRegistry.
 *
 * Matching is purely textual: comment tokens inside string or character
 * literals are treated as comments too.
 *
 * Processing order:
 * 1. Block comments (leftmost, shortest match, may span lines)
 * 2. Line comments, line by line
 * 3. Runs of three or more newlines collapsed to two
 * 4. Leading and trailing whitespace trimmed
 */
class CommentStripper {
public:
    /**
     * Strip comments for the given language.
     *
     * @param source Text to clean
     * @param language Identifier from PatternRegistry::list_languages()
     * @return Cleaned text, or source unchanged if language is unknown
     */
    static std::string remove_comments(const std::string& source,
                                       const std::string& language);

    static std::string remove_comments(const std::string& source,
                                       const LanguageProfile& profile);

    /**
     * Delete every block comment. An opening token without a closing
     * token after it is not a comment and stays in place.
     */
    static std::string remove_block_comments(const std::string& text,
                                             const std::vector<DelimiterPair>& delimiters);

    /**
     * Strip the line comment from every line. Lines that held nothing but
     * a comment are dropped; lines that were already blank are kept.
     */
    static std::string remove_line_comments(const std::string& text,
                                            const std::string& token);

    // Replace every run of 3+ '\n' with exactly "\n\n"
    static std::string collapse_blank_runs(const std::string& text);

    static std::string trim(const std::string& text);

    static bool is_blank(const std::string& text);
};

}  // namespace decomment
