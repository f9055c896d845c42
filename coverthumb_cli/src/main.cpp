//
// Created by Giuseppe Francione on 18/09/25.
//

#include <CLI/CLI.hpp>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli/cli_parser.hpp"
#include "cli/exit_codes.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libcoverthumb/include/cache_config.hpp"
#include "../../libcoverthumb/include/cover_error.hpp"
#include "../../libcoverthumb/include/coverthumb.hpp"
#include "../../libcoverthumb/include/file_utils.hpp"
#include "../../libcoverthumb/include/logger.hpp"
#include "../../libcoverthumb/include/thumbnail_request.hpp"

namespace {

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (const auto level = Logger::string_to_level(settings.log_level)) {
        auto console = std::make_unique<ConsoleLogSink>();
        console->log_level = *level;
        Logger::add_sink(std::move(console));
    }

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, true);
        if (!file_sink->is_open()) {
            std::cerr << "[WARNING] cannot open log file: " << settings.log_file.string() << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
        }
    }
}

coverthumb::CacheConfig make_config(const Settings& settings) {
    coverthumb::CacheConfig config;
    if (settings.no_cache) {
        config = config.with_overlay_search_paths(coverthumb::CacheConfig::default_overlay_search_paths());
    } else if (!settings.cache_dir.empty()) {
        config = config.with_cache_dir(settings.cache_dir)
                       .with_overlay_search_paths(coverthumb::CacheConfig::default_overlay_search_paths());
    } else {
        config = coverthumb::CacheConfig::from_environment();
    }
    if (settings.no_overlay) {
        config = config.with_overlay_search_paths({}).with_embedded_overlay(false);
    }
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"coverthumb: renders the cover of an e-book as a PNG thumbnail."};

    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        return app.exit(e);
    } catch (const CLI::CallForVersion& e) {
        return app.exit(e);
    } catch (const CLI::ParseError& e) {
        (void) app.exit(e);
        return kExitUsage;
    }

    setup_logging(settings);

    std::unique_ptr<coverthumb::ThumbnailRequest> request;
    try {
        request = settings.extension.empty()
            ? std::make_unique<coverthumb::ThumbnailRequest>(
                  coverthumb::ThumbnailRequest::from_path(settings.input, settings.size))
            : std::make_unique<coverthumb::ThumbnailRequest>(settings.input, settings.extension, settings.size);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return kExitUsage;
    }

    try {
        coverthumb::Thumbnailer thumbnailer(make_config(settings));

        if (settings.print_key) {
            if (!thumbnailer.registry().is_supported(request->extension())) {
                throw coverthumb::CoverError(coverthumb::ErrorKind::UnsupportedFormat,
                                             "unsupported extension '" + request->extension() + "'");
            }
            std::cout << thumbnailer.cache_key(*request) << std::endl;
            return kExitOk;
        }

        const std::vector<std::uint8_t> png = thumbnailer.get_or_build_thumbnail(*request);

        if (!coverthumb::write_file_atomic(settings.output, png, "cli")) {
            Logger::log(LogLevel::Error, "cannot write output: " + settings.output.string(), "cli");
            return kExitOutput;
        }

        const auto stats = thumbnailer.stats();
        Logger::log(LogLevel::Info,
                    "wrote " + settings.output.string() + " (" + std::to_string(png.size()) + " bytes, " +
                    (stats.hits > 0 ? "cache hit" : "built") + ")", "cli");
        return kExitOk;
    } catch (const coverthumb::CoverError& e) {
        Logger::log(LogLevel::Error,
                    std::string(coverthumb::to_string(e.kind())) + ": " + e.what(), "cli");
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("unexpected failure: ") + e.what(), "cli");
        return kExitIo;
    }
}
