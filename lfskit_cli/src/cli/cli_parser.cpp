//
// Created by Giuseppe Francione on 20/09/25.
//

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

namespace {
std::vector<std::string> expand_patterns(const std::vector<std::string>& values) {
    std::vector<std::string> patterns;
    for (const auto& value : values) {
        for (auto& p : lfskit::split_patterns(value)) {
            patterns.push_back(std::move(p));
        }
    }
    return patterns;
}
} // namespace

lfskit::PathFilter Settings::make_filter() const {
    return {expand_patterns(include_patterns),
            expand_patterns(exclude_patterns),
            windows_paths ? lfskit::PathStyle::Windows : lfskit::native_path_style()};
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);
    // allow global options after the subcommand name
    app.fallthrough();

    // --- Global options ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress console logging (errors are still reported by exit code).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_option("-I,--include", settings.include_patterns,
                   "Process only paths matching glob PATTERN or below directory PATTERN.\n"
                   "(Can be used multiple times or given as a comma separated list).");

    app.add_option("-X,--exclude", settings.exclude_patterns,
                   "Skip paths matching glob PATTERN or below directory PATTERN.\n"
                   "(Can be used multiple times or given as a comma separated list).");

    app.add_flag("--windows-paths", settings.windows_paths,
                 "Match paths with Windows separator rules regardless of the host.");

    // --- copy ---
    auto* copy = app.add_subcommand("copy", "Copy a file, reporting transfer progress.");
    copy->add_option("source", settings.source, "File to read.")
        ->required()
        ->check(CLI::ExistingFile);
    copy->add_option("destination", settings.destination, "File to write (overwritten).")
        ->required();
    copy->add_option("--event", settings.event, "Event label written to the progress log.")
        ->default_val("download");
    copy->add_option("--name", settings.name,
                     "File name written to the progress log (default: source path).");
    copy->add_option("--index", settings.index, "Position of this file in the batch.")
        ->default_val(1)
        ->check(CLI::PositiveNumber);
    copy->add_option("--total-files", settings.total_files, "Number of files in the batch.")
        ->default_val(1)
        ->check(CLI::PositiveNumber);
    copy->add_option("--size", settings.total_size,
                     "Expected size in bytes (default: size of source).");
    copy->add_option("--progress-log", settings.progress_log,
                     "Absolute path of the progress log (default: no progress log).")
        ->envname("GIT_LFS_PROGRESS");
    copy->add_flag("--bar", settings.progress_bar, "Show a progress bar on stderr.");
    copy->callback([&settings]() {
        settings.command = Command::Copy;
        if (settings.name.empty()) {
            settings.name = settings.source.generic_string();
        }
        if (settings.index > settings.total_files) {
            throw CLI::ValidationError("--index cannot be greater than --total-files.");
        }
    });

    // --- filter ---
    auto* filter = app.add_subcommand("filter",
                                      "Print the given paths (or stdin lines) admitted by the filters.");
    filter->add_option("paths", settings.paths, "Paths to test.");
    filter->callback([&settings]() { settings.command = Command::Filter; });

    // --- scan ---
    auto* scan = app.add_subcommand("scan", "List files below a directory admitted by the filters.");
    scan->add_option("directory", settings.scan_root, "Directory to scan.")
        ->required()
        ->check(CLI::ExistingDirectory);
    scan->add_flag("-r,--recursive", settings.recursive, "Recursively scan subdirectories.");
    scan->callback([&settings]() { settings.command = Command::Scan; });
}
