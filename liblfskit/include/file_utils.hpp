//
// Created by Giuseppe Francione on 13/11/25.
//

#ifndef LFSKIT_FILE_UTILS_HPP
#define LFSKIT_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <string>

namespace lfskit {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "ab").
     * @return FILE* pointer or nullptr if open failed (errno is set).
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Flushes stdio buffers and asks the OS to commit the file to disk.
     *
     * Descriptors that cannot be synced (pipes, character devices) are
     * accepted once the stdio flush succeeded.
     *
     * @return 0 on success, otherwise the errno value of the failing step.
     */
    int sync_file(FILE *file);

    /**
     * @brief Human readable text for an errno value.
     */
    std::string errno_message(int err);

} // namespace lfskit

#endif // LFSKIT_FILE_UTILS_HPP
