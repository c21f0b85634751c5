//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef LFSKIT_CONSOLE_LOG_SINK_HPP
#define LFSKIT_CONSOLE_LOG_SINK_HPP

#include "../../../liblfskit/include/log_sink.hpp"
#include "../../../liblfskit/include/logger.hpp"
#include <iostream>

// stdout belongs to command output, so every level goes to stderr
class ConsoleLogSink final : public lfskit::ILogSink {
public:
    lfskit::LogLevel log_level = lfskit::LogLevel::Error;

    void log(const lfskit::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::cerr << "[" << lfskit::Logger::level_to_string(level) << "][" << tag << "] "
                  << message << std::endl;
    }
};

#endif // LFSKIT_CONSOLE_LOG_SINK_HPP
