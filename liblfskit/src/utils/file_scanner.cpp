//
// Created by Giuseppe Francione on 20/09/25.
//

#include "../../include/file_scanner.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace lfskit {

namespace {

bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini";
}

template <typename Iterator>
void scan(Iterator it, const fs::path& root, const PathFilter& filter, std::vector<std::string>& result) {
    std::error_code ec;
    for (; it != Iterator(); it.increment(ec)) {
        if (ec) {
            Logger::log(LogLevel::Warning, "Scan error below " + root.string() + ": " + ec.message(), "scanner");
            break;
        }
        const fs::path& path = it->path();
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || is_junk(path)) {
            continue;
        }

        const std::string rel = path.lexically_relative(root).generic_string();
        if (filter.admits(rel)) {
            result.push_back(rel);
        } else {
            Logger::log(LogLevel::Debug, "Filtered out: " + rel, "scanner");
        }
    }
}

} // namespace

std::vector<std::string>
collect_files(const fs::path& root,
              const PathFilter& filter,
              const bool recursive) {
    std::vector<std::string> result;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        Logger::log(LogLevel::Error, "Input not found: " + root.string(), "scanner");
        return result;
    }

    if (recursive) {
        scan(fs::recursive_directory_iterator(root, ec), root, filter, result);
    } else {
        scan(fs::directory_iterator(root, ec), root, filter, result);
    }
    if (ec) {
        Logger::log(LogLevel::Error, "Cannot scan " + root.string() + ": " + ec.message(), "scanner");
    }

    std::sort(result.begin(), result.end());
    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}

} // namespace lfskit
