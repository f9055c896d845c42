//
// Created by Giuseppe Francione on 20/09/25.
//

#include "cli_parser.hpp"
#include "../../../libcoverthumb/include/thumbnail_request.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Options ---
    app.add_option("-s,--size", settings.size,
                   "Thumbnail edge in pixels (the cover is fitted inside a square).")
                   ->default_val(256)
                   ->check(CLI::Range(1u, coverthumb::ThumbnailRequest::kMaxRequestedSize));

    app.add_option("--extension", settings.extension,
                   "Treat the input as this format instead of using its file extension "
                   "(epub, mobi, azw, azw3, kf8, prc, fb2, cbz, cbr, txt).");

    auto* cache_dir = app.add_option("--cache-dir", settings.cache_dir,
                   "Thumbnail cache directory (default: $XDG_CACHE_HOME/coverthumb/thumbnails).");

    app.add_flag("--no-cache", settings.no_cache,
                 "Neither read nor write the thumbnail cache.")
                 ->excludes(cache_dir);

    app.add_flag("--no-overlay", settings.no_overlay,
                 "Do not stamp the brand icon on thumbnails.");

    app.add_flag("--print-key", settings.print_key,
                 "Print the cache key of the input and exit.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to a file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("input", settings.input, "E-book file to thumbnail.")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("output", settings.output, "Where to write the PNG thumbnail.");

    // --- Cross-validation logic ---
    // format support is left to the thumbnailer so it exits with the unsupported-format code
    app.callback([&settings]() {
        if (!settings.print_key && settings.output.empty()) {
            throw CLI::ValidationError("output", "An output path is required unless --print-key is given.");
        }
    });
}
