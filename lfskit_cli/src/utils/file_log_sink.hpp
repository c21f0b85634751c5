//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef LFSKIT_FILE_LOG_SINK_HPP
#define LFSKIT_FILE_LOG_SINK_HPP

#include "../../../liblfskit/include/log_sink.hpp"
#include "../../../liblfskit/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

class FileLogSink final : public lfskit::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const lfskit::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << "[" << lfskit::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // LFSKIT_FILE_LOG_SINK_HPP
