//
// Created by Giuseppe Francione on 16/01/26.
//

#include "../../include/path_filter.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

namespace lfskit {

namespace {

bool glob_or_false(const std::string_view pattern, const std::string_view name, const PathStyle style) {
    try {
        return match_glob(pattern, name, style);
    } catch (const BadPatternError& e) {
        Logger::log(LogLevel::Debug, e.what(), "path_filter");
        return false;
    }
}

bool any_pattern_matches(const std::string_view path,
                         const std::string_view cleaned,
                         const std::vector<std::string>& patterns,
                         const PathStyle style) {
    for (const auto& pattern : patterns) {
        if (path_matches_pattern(path, cleaned, pattern, style)) {
            return true;
        }
    }
    return false;
}

} // namespace

bool path_matches_pattern(const std::string_view path,
                          const std::string_view cleaned,
                          const std::string_view pattern,
                          const PathStyle style) {
    if (glob_or_false(pattern, path, style)) {
        return true;
    }
    if (style == PathStyle::Windows && glob_or_false(pattern, cleaned, style)) {
        return true;
    }

    // parent directory given without a wildcard
    return cleaned.size() > pattern.size() &&
           cleaned.starts_with(pattern) &&
           cleaned[pattern.size()] == separator(style);
}

PathFilter::PathFilter(std::vector<std::string> includes,
                       std::vector<std::string> excludes,
                       const PathStyle style)
    : includes_(std::move(includes)), excludes_(std::move(excludes)), style_(style) {}

bool PathFilter::admits(const std::string_view path) const {
    return filename_passes_filter(path, includes_, excludes_, style_);
}

bool filename_passes_filter(const std::string_view filename,
                            const std::vector<std::string>& includes,
                            const std::vector<std::string>& excludes,
                            const PathStyle style) {
    if (includes.empty() && excludes.empty()) {
        return true;
    }

    const std::string cleaned = clean_path(filename, style);

    if (!includes.empty() && !any_pattern_matches(filename, cleaned, includes, style)) {
        return false;
    }
    return !any_pattern_matches(filename, cleaned, excludes, style);
}

std::vector<std::string> split_patterns(const std::string_view list) {
    std::vector<std::string> patterns;
    std::size_t start = 0;

    while (start <= list.size()) {
        std::size_t end = list.find(',', start);
        if (end == std::string_view::npos) {
            end = list.size();
        }

        std::string_view item = list.substr(start, end - start);
        while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) {
            item.remove_prefix(1);
        }
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) {
            item.remove_suffix(1);
        }
        if (!item.empty()) {
            patterns.emplace_back(item);
        }
        start = end + 1;
    }
    return patterns;
}

} // namespace lfskit
