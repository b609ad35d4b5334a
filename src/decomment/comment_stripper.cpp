#include <decomment/comment_stripper.hpp>
#include <decomment/pattern_registry.hpp>

#include <cstring>

namespace decomment {

namespace {

constexpr const char* WHITESPACE = " \t\n\v\f\r";

bool is_space(char c) {
    return c != '\0' && std::strchr(WHITESPACE, c) != nullptr;
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(WHITESPACE);
    if (end == std::string::npos) {
        return "";
    }
    return s.substr(0, end + 1);
}

}  // namespace

std::string CommentStripper::remove_comments(const std::string& source,
                                             const std::string& language) {
    auto profile = PatternRegistry::language_profile(language);
    if (!profile.ok()) {
        return source;
    }
    return remove_comments(source, profile.value());
}

std::string CommentStripper::remove_comments(const std::string& source,
                                             const LanguageProfile& profile) {
    std::string text = source;

    if (profile.has_block_comment()) {
        text = remove_block_comments(text, profile.block_comments);
    }

    if (profile.has_line_comment()) {
        text = remove_line_comments(text, *profile.line_comment);
    }

    return trim(collapse_blank_runs(text));
}

std::string CommentStripper::remove_block_comments(const std::string& text,
                                                   const std::vector<DelimiterPair>& delimiters) {
    struct Candidate {
        const DelimiterPair* pair;
        size_t next_open;  // Cached position of the next opening token
    };

    std::vector<Candidate> live;
    for (const auto& pair : delimiters) {
        if (!pair.open.empty() && !pair.close.empty()) {
            live.push_back({&pair, text.find(pair.open)});
        }
    }

    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size() && !live.empty()) {
        // Leftmost opening token; ties go to the earlier pair
        auto best = live.end();
        for (auto it = live.begin(); it != live.end(); ++it) {
            if (it->next_open != std::string::npos && it->next_open < pos) {
                it->next_open = text.find(it->pair->open, pos);
            }
            if (it->next_open == std::string::npos) {
                continue;
            }
            if (best == live.end() || it->next_open < best->next_open) {
                best = it;
            }
        }

        if (best == live.end()) {
            break;
        }

        size_t start = best->next_open;
        size_t close = text.find(best->pair->close, start + best->pair->open.size());
        if (close == std::string::npos) {
            // No closing token anywhere after this point, so the pair can
            // never match again. Other pairs may still start here.
            live.erase(best);
            continue;
        }

        result.append(text, pos, start - pos);
        pos = close + best->pair->close.size();
    }

    if (pos < text.size()) {
        result.append(text, pos, std::string::npos);
    }

    return result;
}

std::string CommentStripper::remove_line_comments(const std::string& text,
                                                  const std::string& token) {
    if (token.empty()) {
        return text;
    }

    std::string result;
    result.reserve(text.size());

    bool first = true;
    size_t line_start = 0;
    while (true) {
        size_t line_end = text.find('\n', line_start);
        std::string line = text.substr(line_start, line_end == std::string::npos
                                                       ? std::string::npos
                                                       : line_end - line_start);

        bool originally_blank = is_blank(line);

        size_t comment = line.find(token);
        if (comment != std::string::npos) {
            line = rtrim(line.substr(0, comment));
        }

        if (originally_blank || !is_blank(line)) {
            if (!first) {
                result += '\n';
            }
            result += line;
            first = false;
        }

        if (line_end == std::string::npos) {
            break;
        }
        line_start = line_end + 1;
    }

    return result;
}

std::string CommentStripper::collapse_blank_runs(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t run = 0;
    for (char c : text) {
        if (c == '\n') {
            if (++run <= 2) {
                result += c;
            }
        } else {
            run = 0;
            result += c;
        }
    }

    return result;
}

std::string CommentStripper::trim(const std::string& text) {
    size_t start = text.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(start, end - start + 1);
}

bool CommentStripper::is_blank(const std::string& text) {
    for (char c : text) {
        if (!is_space(c)) {
            return false;
        }
    }
    return true;
}

}  // namespace decomment
