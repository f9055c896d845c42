//
// Created by Giuseppe Francione on 11/12/25.
//

#include "../../libcoverthumb/include/cover_error.hpp"
#include "../../libcoverthumb/include/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

namespace {

struct Entry {
    LogLevel level;
    std::string message;
    std::string tag;
};

class CapturingSink final : public ILogSink {
public:
    explicit CapturingSink(std::vector<Entry>& out) : out_(out) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        out_.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::vector<Entry>& out_;
};

} // namespace

TEST_CASE("Logger fans out to every sink", "[logger]") {
    std::vector<Entry> first;
    std::vector<Entry> second;

    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<CapturingSink>(first));
    Logger::add_sink(std::make_unique<CapturingSink>(second));

    Logger::log(LogLevel::Warning, "cache-write-failure", "ThumbnailCache");
    Logger::log(LogLevel::Debug, "untagged");

    REQUIRE(first.size() == 2);
    REQUIRE(second.size() == 2);
    CHECK(first[0].level == LogLevel::Warning);
    CHECK(first[0].tag == "ThumbnailCache");
    CHECK(first[1].tag == "coverthumb");

    Logger::clear_sinks();
    Logger::log(LogLevel::Error, "dropped");
    CHECK(first.size() == 2);
}

TEST_CASE("Log level names", "[logger]") {
    CHECK(std::string(Logger::level_to_string(LogLevel::Debug)) == "DEBUG");
    CHECK(std::string(Logger::level_to_string(LogLevel::Warning)) == "WARNING");

    CHECK(Logger::string_to_level("error") == LogLevel::Error);
    CHECK(Logger::string_to_level("Warn") == LogLevel::Warning);
    CHECK(Logger::string_to_level("INFO") == LogLevel::Info);
    CHECK_FALSE(Logger::string_to_level("NONE").has_value());
    CHECK_FALSE(Logger::string_to_level("verbose").has_value());
}

TEST_CASE("Error kind names", "[logger]") {
    using coverthumb::ErrorKind;
    CHECK(coverthumb::to_string(ErrorKind::UnsupportedFormat) == "unsupported-format");
    CHECK(coverthumb::to_string(ErrorKind::CacheWriteFailure) == "cache-write-failure");

    const coverthumb::CoverError err(ErrorKind::NoCoverFound, "empty archive");
    CHECK(err.kind() == ErrorKind::NoCoverFound);
    CHECK(std::string(err.what()) == "empty archive");
}
