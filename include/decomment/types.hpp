#pragma once

#include <optional>
#include <string>
#include <vector>

namespace decomment {

// Identifier used when a filename has no mapped extension
constexpr const char* DEFAULT_LANGUAGE = "Python";

// Inserted between stem and extension when saving next to the input file
constexpr const char* OUTPUT_SUFFIX = "_nocomments";

// Opening and closing token of a block comment, e.g. "/*" and "*/"
struct DelimiterPair {
    std::string open;
    std::string close;

    bool operator==(const DelimiterPair& other) const {
        return open == other.open && close == other.close;
    }
};

// Comment syntax of one language (or family of languages sharing it)
struct LanguageProfile {
    std::string name;                           // Unique identifier, e.g. "Lua"
    std::optional<std::string> line_comment;    // Token running to end of line
    std::vector<DelimiterPair> block_comments;  // Tried in order at each position

    bool has_line_comment() const { return line_comment.has_value(); }
    bool has_block_comment() const { return !block_comments.empty(); }
};

// Settings shared by every command of the shell
struct Config {
    bool verbose = false;
};

}  // namespace decomment
