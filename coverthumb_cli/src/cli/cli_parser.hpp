//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef COVERTHUMB_CLI_PARSER_HPP
#define COVERTHUMB_CLI_PARSER_HPP

#include <cstdint>
#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::uint32_t size = 256;
    std::string extension;
    std::filesystem::path cache_dir;
    bool no_cache = false;
    bool print_key = false;
    bool no_overlay = false;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;

    std::filesystem::path input;
    std::filesystem::path output;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 *
 * The positional form follows the freedesktop thumbnailer convention:
 * `coverthumb -s %s %i %o`.
 *
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //COVERTHUMB_CLI_PARSER_HPP
