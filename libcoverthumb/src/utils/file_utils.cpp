//
// Created by Giuseppe Francione on 17/11/25.
//

#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <system_error>

namespace coverthumb {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
        return std::fopen(path.string().c_str(), mode);
    }

    std::optional<std::vector<std::uint8_t>> read_file(const std::filesystem::path& path,
                                                       const std::uintmax_t max_bytes) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec || size > max_bytes) return std::nullopt;

        const unique_FILE f(open_file(path, "rb"));
        if (!f) return std::nullopt;

        std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
        if (!data.empty() && std::fread(data.data(), 1, data.size(), f.get()) != data.size()) {
            return std::nullopt;
        }
        return data;
    }

    bool write_file_atomic(const std::filesystem::path& target,
                           const std::span<const std::uint8_t> data,
                           const std::string_view tag) {
        const auto tmp = std::filesystem::path(target).concat("." + RandomUtils::random_suffix() + ".tmp");
        std::error_code ec;

        {
            const unique_FILE out(open_file(tmp, "wb"));
            if (!out) {
                Logger::log(LogLevel::Warning, "Cannot create temp file: " + tmp.string(), tag);
                return false;
            }
            const bool written = std::fwrite(data.data(), 1, data.size(), out.get()) == data.size();
            if (!written || std::fflush(out.get()) != 0) {
                Logger::log(LogLevel::Warning, "Short write to temp file: " + tmp.string(), tag);
                std::filesystem::remove(tmp, ec);
                return false;
            }
        } // closed here

        std::filesystem::rename(tmp, target, ec);
        if (ec) {
            Logger::log(LogLevel::Warning,
                "Can't move " + tmp.string() + " to " + target.string() + " (" + ec.message() + ")", tag);
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return false;
        }
        return true;
    }

} // namespace coverthumb
