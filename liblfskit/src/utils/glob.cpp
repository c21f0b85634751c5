//
// Created by Giuseppe Francione on 16/01/26.
//

#include "../../include/glob.hpp"
#include "../../include/errors.hpp"
#include <cctype>

namespace lfskit {

namespace {

struct Rune {
    char32_t value;
    std::size_t length;
    bool valid;
};

// decode one UTF-8 sequence; invalid input yields U+FFFD with length 1
Rune decode_rune(const std::string_view s) {
    constexpr Rune invalid{0xFFFD, 1, false};
    const auto c0 = static_cast<unsigned char>(s[0]);
    if (c0 < 0x80) {
        return {c0, 1, true};
    }

    std::size_t len = 0;
    char32_t cp = 0;
    if ((c0 & 0xE0) == 0xC0) {
        len = 2;
        cp = c0 & 0x1F;
    } else if ((c0 & 0xF0) == 0xE0) {
        len = 3;
        cp = c0 & 0x0F;
    } else if ((c0 & 0xF8) == 0xF0) {
        len = 4;
        cp = c0 & 0x07;
    } else {
        return invalid;
    }
    if (s.size() < len) {
        return invalid;
    }
    for (std::size_t i = 1; i < len; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) {
            return invalid;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
        return invalid;
    }
    return {cp, len, true};
}

/**
 * A pattern is split into chunks: an optional run of '*' followed by the
 * literal/class/'?' text up to the next unbracketed '*'.
 */
struct Chunk {
    bool star = false;
    std::string_view text;
};

class GlobMatcher {
public:
    GlobMatcher(const std::string_view pattern, const PathStyle style)
        : pattern_(pattern), style_(style), sep_(separator(style)) {}

    bool match(std::string_view name) const {
        std::string_view pattern = pattern_;

        while (!pattern.empty()) {
            const Chunk chunk = next_chunk(pattern);

            // trailing star swallows the rest unless a separator follows
            if (chunk.star && chunk.text.empty()) {
                return name.find(sep_) == std::string_view::npos;
            }

            std::string_view rest;
            // on the last chunk the name has to be consumed entirely
            if (match_chunk(chunk.text, name, rest) && (rest.empty() || !pattern.empty())) {
                name = rest;
                continue;
            }

            bool advanced = false;
            if (chunk.star) {
                // let the star eat one more character at a time, never a separator
                for (std::size_t i = 0; i < name.size() && name[i] != sep_; ++i) {
                    if (match_chunk(chunk.text, name.substr(i + 1), rest)) {
                        if (pattern.empty() && !rest.empty()) {
                            continue;
                        }
                        name = rest;
                        advanced = true;
                        break;
                    }
                }
            }
            if (advanced) {
                continue;
            }

            // no match, but a malformed tail must still be reported
            while (!pattern.empty()) {
                const Chunk tail = next_chunk(pattern);
                std::string_view ignored;
                match_chunk(tail.text, {}, ignored);
            }
            return false;
        }
        return name.empty();
    }

private:
    [[noreturn]] void bad_pattern() const {
        throw BadPatternError(std::string(pattern_));
    }

    Chunk next_chunk(std::string_view& pattern) const {
        Chunk chunk;
        while (!pattern.empty() && pattern.front() == '*') {
            pattern.remove_prefix(1);
            chunk.star = true;
        }

        bool in_range = false;
        std::size_t i = 0;
        for (; i < pattern.size(); ++i) {
            const char c = pattern[i];
            if (c == '\\' && style_ == PathStyle::Posix) {
                // a dangling escape is reported by match_chunk
                if (i + 1 < pattern.size()) {
                    ++i;
                }
            } else if (c == '[') {
                in_range = true;
            } else if (c == ']') {
                in_range = false;
            } else if (c == '*' && !in_range) {
                break;
            }
        }
        chunk.text = pattern.substr(0, i);
        pattern.remove_prefix(i);
        return chunk;
    }

    // Matches chunk against the beginning of s; on success rest holds the
    // unmatched tail of s. The whole chunk is always parsed so syntax errors
    // surface even after a mismatch.
    bool match_chunk(std::string_view chunk, std::string_view s, std::string_view& rest) const {
        bool failed = false;

        while (!chunk.empty()) {
            if (!failed && s.empty()) {
                failed = true;
            }

            switch (chunk.front()) {
                case '[': {
                    char32_t r = 0;
                    if (!failed) {
                        const Rune rune = decode_rune(s);
                        r = rune.value;
                        s.remove_prefix(rune.length);
                    }
                    chunk.remove_prefix(1);

                    bool negated = false;
                    if (!chunk.empty() && chunk.front() == '^') {
                        negated = true;
                        chunk.remove_prefix(1);
                    }

                    bool matched = false;
                    int ranges = 0;
                    while (true) {
                        if (!chunk.empty() && chunk.front() == ']' && ranges > 0) {
                            chunk.remove_prefix(1);
                            break;
                        }
                        const char32_t lo = class_char(chunk);
                        char32_t hi = lo;
                        if (chunk.front() == '-') {
                            chunk.remove_prefix(1);
                            hi = class_char(chunk);
                        }
                        if (lo <= r && r <= hi) {
                            matched = true;
                        }
                        ++ranges;
                    }
                    if (matched == negated) {
                        failed = true;
                    }
                    break;
                }

                case '?':
                    if (!failed) {
                        if (s.front() == sep_) {
                            failed = true;
                        }
                        s.remove_prefix(decode_rune(s).length);
                    }
                    chunk.remove_prefix(1);
                    break;

                case '\\':
                    if (style_ == PathStyle::Posix) {
                        chunk.remove_prefix(1);
                        if (chunk.empty()) {
                            bad_pattern();
                        }
                    }
                    [[fallthrough]];

                default:
                    if (!failed) {
                        if (chunk.front() != s.front()) {
                            failed = true;
                        }
                        s.remove_prefix(1);
                    }
                    chunk.remove_prefix(1);
                    break;
            }
        }

        if (failed) {
            return false;
        }
        rest = s;
        return true;
    }

    // one (possibly escaped) character of a bracket expression; something
    // must follow it, at least the closing ']'
    char32_t class_char(std::string_view& chunk) const {
        if (chunk.empty() || chunk.front() == '-' || chunk.front() == ']') {
            bad_pattern();
        }
        if (chunk.front() == '\\' && style_ == PathStyle::Posix) {
            chunk.remove_prefix(1);
            if (chunk.empty()) {
                bad_pattern();
            }
        }
        const Rune rune = decode_rune(chunk);
        if (!rune.valid) {
            bad_pattern();
        }
        chunk.remove_prefix(rune.length);
        if (chunk.empty()) {
            bad_pattern();
        }
        return rune.value;
    }

    std::string_view pattern_;
    PathStyle style_;
    char sep_;
};

bool is_separator(const char c, const PathStyle style) {
    return c == '/' || (style == PathStyle::Windows && c == '\\');
}

std::size_t volume_length(const std::string_view path, const PathStyle style) {
    if (style == PathStyle::Windows && path.size() >= 2 && path[1] == ':' &&
        std::isalpha(static_cast<unsigned char>(path[0]))) {
        return 2;
    }
    return 0;
}

} // namespace

bool match_glob(const std::string_view pattern, const std::string_view name, const PathStyle style) {
    return GlobMatcher(pattern, style).match(name);
}

std::string clean_path(std::string_view path, const PathStyle style) {
    const char sep = separator(style);
    const std::size_t vol_len = volume_length(path, style);
    const std::string volume(path.substr(0, vol_len));
    path.remove_prefix(vol_len);

    if (path.empty()) {
        return volume + ".";
    }

    const bool rooted = is_separator(path.front(), style);
    const std::size_t n = path.size();
    std::string out;
    out.reserve(n);

    std::size_t r = 0;
    // out.size() at which ".." can no longer remove an element
    std::size_t dotdot = 0;
    if (rooted) {
        out.push_back(sep);
        r = 1;
        dotdot = 1;
    }

    while (r < n) {
        if (is_separator(path[r], style)) {
            ++r;
        } else if (path[r] == '.' && (r + 1 == n || is_separator(path[r + 1], style))) {
            ++r;
        } else if (path[r] == '.' && path[r + 1] == '.' && (r + 2 == n || is_separator(path[r + 2], style))) {
            r += 2;
            if (out.size() > dotdot) {
                std::size_t w = out.size() - 1;
                while (w > dotdot && !is_separator(out[w], style)) {
                    --w;
                }
                out.resize(w);
            } else if (!rooted) {
                if (!out.empty()) {
                    out.push_back(sep);
                }
                out += "..";
                dotdot = out.size();
            }
        } else {
            if ((rooted && out.size() != 1) || (!rooted && !out.empty())) {
                out.push_back(sep);
            }
            for (; r < n && !is_separator(path[r], style); ++r) {
                out.push_back(path[r]);
            }
        }
    }

    if (out.empty()) {
        out = ".";
    }
    return volume + out;
}

} // namespace lfskit
