//
// Created by Giuseppe Francione on 16/01/26.
//

/**
 * @file glob.hpp
 * @brief Shell-style pattern matching and lexical path cleaning.
 *
 * Both operations take the path convention explicitly so that Windows
 * behaviour can be exercised on any host.
 */

#ifndef LFSKIT_GLOB_HPP
#define LFSKIT_GLOB_HPP

#include <string>
#include <string_view>

namespace lfskit {

/**
 * @brief Path separator convention.
 *
 * Posix: '/' separates elements and '\' escapes the next pattern character.
 * Windows: '\' is the separator (and '/' is accepted as one when cleaning),
 * so there is no escape character in patterns.
 */
enum class PathStyle {
    Posix,
    Windows
};

constexpr char separator(const PathStyle style) {
    return style == PathStyle::Windows ? '\\' : '/';
}

/**
 * @brief Convention of the platform lfskit was built for.
 */
constexpr PathStyle native_path_style() {
#ifdef _WIN32
    return PathStyle::Windows;
#else
    return PathStyle::Posix;
#endif
}

/**
 * @brief Reports whether @p name matches the shell pattern @p pattern.
 *
 * The whole name must match. Pattern syntax:
 *  - '*'      any sequence of non-separator characters
 *  - '?'      any single non-separator character
 *  - '[...]'  character class; ranges 'a-z', leading '^' negates
 *  - '\c'     literal c (Posix style only)
 *
 * @throws BadPatternError if the pattern is malformed. The error is raised
 * even when the name fails to match earlier in the pattern.
 */
bool match_glob(std::string_view pattern, std::string_view name,
                PathStyle style = native_path_style());

/**
 * @brief Returns the shortest lexically equivalent path.
 *
 * Repeated separators are collapsed, "." elements dropped, "name/.."
 * pairs removed (".." at the root of a rooted path is dropped) and the
 * trailing separator stripped. An empty result becomes ".". For Windows
 * style '/' is accepted as a separator, the output uses '\' and a drive
 * letter prefix ("C:") is kept as is.
 */
std::string clean_path(std::string_view path,
                       PathStyle style = native_path_style());

} // namespace lfskit

#endif // LFSKIT_GLOB_HPP
