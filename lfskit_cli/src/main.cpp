//
// Created by Giuseppe Francione on 18/09/25.
//

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../liblfskit/include/byte_stream.hpp"
#include "../../liblfskit/include/file_scanner.hpp"
#include "../../liblfskit/include/logger.hpp"
#include "../../liblfskit/include/progress_log.hpp"
#include "../../liblfskit/include/progress_reader.hpp"

using namespace lfskit;
namespace fs = std::filesystem;

// simple progress bar printer
inline void print_progress_bar(const std::int64_t done, const std::int64_t total, const double elapsed_seconds) {
    constexpr unsigned bar_width = 40;

    double progress = total > 0 ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    // the declared size may be an estimate
    progress = std::min(progress, 1.0);
    const auto pos = static_cast<unsigned>(bar_width * progress);

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && progress < 1.0) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << progress * 100.0 << "%"
              << " (" << done << "/" << total << " bytes)"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

static int run_copy(const Settings& settings) {
    std::int64_t total = settings.total_size;
    if (total < 0) {
        std::error_code ec;
        const auto size = fs::file_size(settings.source, ec);
        total = ec ? 0 : static_cast<std::int64_t>(size);
    }

    try {
        // opened first: a bad destination must fail before the copy starts
        ProgressLogFile progress = open_progress_log(ProgressLogOptions{settings.progress_log},
                                                     settings.event,
                                                     settings.name,
                                                     settings.index,
                                                     settings.total_files);

        CopyCallback bar;
        if (settings.progress_bar && !settings.quiet) {
            bar = [start = std::chrono::steady_clock::now()](const std::int64_t size,
                                                             const std::int64_t so_far,
                                                             std::size_t) {
                const double elapsed = std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - start).count();
                print_progress_bar(so_far, size, elapsed);
            };
        }

        FileWriter writer(settings.destination);
        const std::int64_t copied = copy_with_callback(writer,
                                                       std::make_unique<FileReader>(settings.source),
                                                       total,
                                                       chain_callbacks(progress.callback, bar));
        writer.close();
        if (progress) {
            progress.log->close();
        }
        if (bar) {
            std::cerr << std::endl;
        }

        Logger::log(LogLevel::Info,
                    "Copied " + std::to_string(copied) + " bytes: " +
                    settings.source.string() + " -> " + settings.destination.string(),
                    "main");
        return 0;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return 1;
    }
}

static int run_filter(const Settings& settings) {
    const PathFilter filter = settings.make_filter();

    auto emit = [&filter](const std::string& path) {
        if (filter.admits(path)) {
            std::cout << path << "\n";
        } else {
            Logger::log(LogLevel::Debug, "Rejected: " + path, "filter");
        }
    };

    if (!settings.paths.empty()) {
        std::for_each(settings.paths.begin(), settings.paths.end(), emit);
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                emit(line);
            }
        }
    }
    std::cout << std::flush;
    return 0;
}

static int run_scan(const Settings& settings) {
    for (const auto& path : collect_files(settings.scan_root, settings.make_filter(), settings.recursive)) {
        std::cout << path << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int main(int argc, char* argv[]) {

    CLI::App app{"lfskit: transfer progress logging and include/exclude path filtering."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file);
        if (!fileSink->is_open()) {
            std::cerr << "Cannot open log file: " << settings.log_file.string() << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }
    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    switch (settings.command) {
        case Command::Copy:
            return run_copy(settings);
        case Command::Filter:
            return run_filter(settings);
        case Command::Scan:
            return run_scan(settings);
        case Command::None:
            break;
    }
    std::cerr << app.help() << std::endl;
    return 1;
}
