//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef LFSKIT_FILE_SCANNER_HPP
#define LFSKIT_FILE_SCANNER_HPP

#include "path_filter.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace lfskit {

/**
 * @brief Lists regular files below @p root admitted by @p filter.
 *
 * Paths are tested and returned relative to @p root with '/' separators,
 * the form git uses for repository paths. OS junk (.DS_Store, desktop.ini,
 * AppleDouble "._" files) is skipped. Results are sorted.
 *
 * @param root Directory to scan. A missing root is logged and yields nothing.
 * @param filter Include/exclude filter applied to the relative paths.
 * @param recursive Descend into subdirectories.
 */
std::vector<std::string>
collect_files(const std::filesystem::path& root,
              const PathFilter& filter,
              bool recursive);

} // namespace lfskit

#endif //LFSKIT_FILE_SCANNER_HPP
