//
// Created by Giuseppe Francione on 17/11/25.
//

#include "../../include/file_utils.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace lfskit {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // On Windows, convert mode to wstring and use _wfopen, which accepts
        // wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    int sync_file(FILE* file) {
        if (std::fflush(file) != 0) {
            return errno;
        }
#ifdef _WIN32
        if (_commit(_fileno(file)) != 0) {
            return errno;
        }
#else
        if (fsync(fileno(file)) != 0 && errno != EINVAL && errno != EROFS) {
            return errno;
        }
#endif
        return 0;
    }

    std::string errno_message(const int err) {
        return std::generic_category().message(err);
    }

} // namespace lfskit
