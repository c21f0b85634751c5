//
// Created by Giuseppe Francione on 15/01/26.
//

/**
 * @file progress_log.hpp
 * @brief Append-only transfer progress log.
 *
 * Each line has the form
 * @code
 * <event> <index>/<total_files> <written>/<total> <filename>
 * @endcode
 * and is synced to disk as soon as it is written, so external tools can
 * tail the file while a transfer runs.
 */

#ifndef LFSKIT_PROGRESS_LOG_HPP
#define LFSKIT_PROGRESS_LOG_HPP

#include "progress_reader.hpp"
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace lfskit {

/**
 * @brief Where progress lines go. An empty destination disables logging.
 * The destination must be an absolute path.
 */
struct ProgressLogOptions {
    std::string destination;
};

/**
 * @brief Open progress log file plus the last cumulative total written to it.
 *
 * Owns the file handle and closes it on destruction, so a copy that throws
 * cannot leak the descriptor. Not thread-safe: one instance per copy.
 */
class ProgressLog {
public:
    ProgressLog(FILE* fp,
                std::string destination,
                std::string event,
                std::string filename,
                int index,
                int total_files);
    ~ProgressLog();

    ProgressLog(const ProgressLog&) = delete;
    ProgressLog& operator=(const ProgressLog&) = delete;

    /**
     * @brief Appends a line for the given progress unless @p written equals
     * the last logged total.
     * @throws ProgressLogError if writing or syncing fails.
     */
    void record(std::int64_t total, std::int64_t written);

    /**
     * @brief Callback forwarding to record(). Must not outlive this object.
     */
    [[nodiscard]] CopyCallback callback();

    /**
     * @brief Closes the file. Safe to call more than once.
     * @throws ProgressLogError if the final close fails.
     */
    void close();

    [[nodiscard]] bool is_open() const { return fp_ != nullptr; }
    [[nodiscard]] std::int64_t last_logged_total() const { return last_logged_total_; }
    [[nodiscard]] const std::string& destination() const { return destination_; }

private:
    FILE* fp_ = nullptr;
    std::string destination_;
    std::string event_;
    std::string filename_;
    int index_ = 0;
    int total_files_ = 0;
    std::int64_t last_logged_total_ = 0;
};

/**
 * @brief Result of open_progress_log(). Both members are empty when
 * progress logging is disabled.
 */
struct ProgressLogFile {
    CopyCallback callback;
    std::unique_ptr<ProgressLog> log;

    explicit operator bool() const { return log != nullptr; }
};

/**
 * @brief Opens the progress log for one file transfer.
 *
 * Returns an empty ProgressLogFile when the destination, the event or the
 * filename is empty. Otherwise creates the destination's parent
 * directories, opens the destination for append and returns a callback
 * bound to the new log.
 *
 * @param options Log destination.
 * @param event Event label, e.g. "download" or "upload".
 * @param filename Name of the transferred file as shown in the log.
 * @param index 1-based position of this file in the batch.
 * @param total_files Number of files in the batch.
 * @throws ConfigurationError if the destination is not absolute (nothing is created).
 * @throws ProgressLogError if the directory or the file cannot be created.
 */
ProgressLogFile open_progress_log(const ProgressLogOptions& options,
                                  const std::string& event,
                                  const std::string& filename,
                                  int index,
                                  int total_files);

} // namespace lfskit

#endif // LFSKIT_PROGRESS_LOG_HPP
