//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef LFSKIT_CLI_PARSER_HPP
#define LFSKIT_CLI_PARSER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../../../liblfskit/include/path_filter.hpp"

// forward declaration
namespace CLI { class App; }

enum class Command {
    None,
    Copy,
    Filter,
    Scan
};

struct Settings {
    Command command = Command::None;

    // --- global ---
    bool quiet = false;
    bool windows_paths = false;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    // --- copy ---
    std::filesystem::path source;
    std::filesystem::path destination;
    std::string event = "download";
    std::string name;
    int index = 1;
    int total_files = 1;
    std::int64_t total_size = -1;
    std::string progress_log;
    bool progress_bar = false;

    // --- filter ---
    std::vector<std::string> paths;

    // --- scan ---
    std::filesystem::path scan_root;
    bool recursive = false;

    /**
     * @brief Builds the include/exclude filter, expanding comma separated values.
     */
    [[nodiscard]] lfskit::PathFilter make_filter() const;
};

/**
 * @brief Configures the CLI11 parser with all subcommands, options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //LFSKIT_CLI_PARSER_HPP
