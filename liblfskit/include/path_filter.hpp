//
// Created by Giuseppe Francione on 16/01/26.
//

/**
 * @file path_filter.hpp
 * @brief Include/exclude decision for repository paths.
 */

#ifndef LFSKIT_PATH_FILTER_HPP
#define LFSKIT_PATH_FILTER_HPP

#include "glob.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace lfskit {

/**
 * @brief Include/exclude glob filter.
 *
 * @details A path is admitted when it matches at least one include pattern
 * (or there are none) and no exclude pattern. A pattern matches a path when
 *  -# the path matches it as a glob,
 *  -# for Windows style, the cleaned path matches it as a glob
 *     (git reports paths with '/' separators), or
 *  -# the cleaned path starts with the pattern followed by a separator, so a
 *     plain directory name selects everything below it.
 *
 * Malformed patterns never match. Pattern order does not affect the result.
 * The filter holds no mutable state and may be shared between threads.
 */
class PathFilter {
public:
    PathFilter() = default;
    PathFilter(std::vector<std::string> includes,
               std::vector<std::string> excludes,
               PathStyle style = native_path_style());

    /**
     * @brief Returns true if @p path should be processed.
     */
    [[nodiscard]] bool admits(std::string_view path) const;

    /**
     * @brief True when neither includes nor excludes are set.
     */
    [[nodiscard]] bool empty() const { return includes_.empty() && excludes_.empty(); }

    [[nodiscard]] const std::vector<std::string>& includes() const { return includes_; }
    [[nodiscard]] const std::vector<std::string>& excludes() const { return excludes_; }
    [[nodiscard]] PathStyle style() const { return style_; }

private:
    std::vector<std::string> includes_;
    std::vector<std::string> excludes_;
    PathStyle style_ = native_path_style();
};

/**
 * @brief Returns true if @p pattern selects @p path under the three rules
 * documented on PathFilter. @p cleaned must be clean_path(path, style).
 */
bool path_matches_pattern(std::string_view path,
                          std::string_view cleaned,
                          std::string_view pattern,
                          PathStyle style = native_path_style());

/**
 * @brief Returns whether a given filename passes the include/exclude filters.
 *
 * Only paths matching an include pattern and no exclude pattern pass. An
 * empty list does not filter anything.
 */
bool filename_passes_filter(std::string_view filename,
                            const std::vector<std::string>& includes,
                            const std::vector<std::string>& excludes,
                            PathStyle style = native_path_style());

/**
 * @brief Splits a comma separated pattern list ("*.bin, docs ,media/*").
 *
 * Surrounding blanks are trimmed and empty entries dropped; order is kept.
 */
std::vector<std::string> split_patterns(std::string_view list);

} // namespace lfskit

#endif // LFSKIT_PATH_FILTER_HPP
