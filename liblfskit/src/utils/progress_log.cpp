//
// Created by Giuseppe Francione on 15/01/26.
//

#include "../../include/progress_log.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace lfskit {

ProgressLog::ProgressLog(FILE* fp,
                         std::string destination,
                         std::string event,
                         std::string filename,
                         const int index,
                         const int total_files)
    : fp_(fp),
      destination_(std::move(destination)),
      event_(std::move(event)),
      filename_(std::move(filename)),
      index_(index),
      total_files_(total_files) {}

ProgressLog::~ProgressLog() {
    if (fp_) {
        std::fclose(fp_);
    }
}

void ProgressLog::record(const std::int64_t total, const std::int64_t written) {
    if (written == last_logged_total_) {
        return;
    }
    if (!fp_) {
        throw ProgressLogError(event_, destination_, "log file is closed");
    }

    const std::string line = event_ + " " +
                             std::to_string(index_) + "/" + std::to_string(total_files_) + " " +
                             std::to_string(written) + "/" + std::to_string(total) + " " +
                             filename_ + "\n";

    if (std::fwrite(line.data(), 1, line.size(), fp_) != line.size()) {
        throw ProgressLogError(event_, destination_, errno_message(errno));
    }
    if (const int err = sync_file(fp_); err != 0) {
        throw ProgressLogError(event_, destination_, errno_message(err));
    }
    last_logged_total_ = written;
}

CopyCallback ProgressLog::callback() {
    return [this](const std::int64_t total, const std::int64_t written, std::size_t) {
        record(total, written);
    };
}

void ProgressLog::close() {
    if (!fp_) {
        return;
    }
    FILE* fp = fp_;
    fp_ = nullptr;
    if (std::fclose(fp) != 0) {
        throw ProgressLogError(event_, destination_, errno_message(errno));
    }
}

ProgressLogFile open_progress_log(const ProgressLogOptions& options,
                                  const std::string& event,
                                  const std::string& filename,
                                  const int index,
                                  const int total_files) {
    if (options.destination.empty() || filename.empty() || event.empty()) {
        return {};
    }

    const fs::path log_path(options.destination);
    if (!log_path.is_absolute()) {
        throw ConfigurationError("progress log destination must be an absolute path: " + options.destination);
    }

    if (const fs::path dir = log_path.parent_path(); !dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw ProgressLogError(event, options.destination, ec.message());
        }
    }

    FILE* fp = open_file(log_path, "ab");
    if (!fp) {
        throw ProgressLogError(event, options.destination, errno_message(errno));
    }

    Logger::log(LogLevel::Debug,
                "Logging " + event + " progress of " + filename + " to " + options.destination,
                "progress_log");

    ProgressLogFile result;
    result.log = std::make_unique<ProgressLog>(fp, options.destination, event, filename, index, total_files);
    result.callback = result.log->callback();
    return result;
}

} // namespace lfskit
