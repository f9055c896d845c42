//
// Created by Giuseppe Francione on 12/12/25.
//

#ifndef COVERTHUMB_TEST_FIXTURES_HPP
#define COVERTHUMB_TEST_FIXTURES_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace coverthumb::test {

using Bytes = std::vector<std::uint8_t>;

/// Solid-colour PNG.
Bytes make_png(std::uint32_t width, std::uint32_t height, std::array<std::uint8_t, 4> fill);

/// Solid-colour baseline JPEG (quality 90).
Bytes make_jpeg(std::uint32_t width, std::uint32_t height, std::uint8_t r, std::uint8_t g, std::uint8_t b);

struct ZipEntry {
    std::string name;
    Bytes data;
};

/// Stored (uncompressed) zip archive, entries in the given order.
Bytes make_zip(const std::vector<ZipEntry>& entries);

/// One raw EXTH record. @p declared_length overrides the length field when set.
Bytes make_exth_record(std::uint32_t type, const Bytes& payload,
                       std::optional<std::uint32_t> declared_length = std::nullopt);

/// Big-endian four byte payload, as used by numeric EXTH records.
Bytes be32_bytes(std::uint32_t value);

/**
 * @brief Minimal Mobipocket database.
 *
 * Record 0 carries the MOBI header (first image index = @p first_image)
 * and, when @p with_exth is set, an EXTH block holding a type 201 record
 * for @p cover_offset if one is given, followed by @p extra_exth verbatim.
 * @p records follow as records 1..n.
 */
Bytes make_mobi(const std::vector<Bytes>& records,
                std::optional<std::uint32_t> cover_offset,
                std::uint32_t first_image = 1,
                bool with_exth = true,
                const std::vector<Bytes>& extra_exth = {});

std::string base64_encode(std::span<const std::uint8_t> data);

Bytes bytes_of(std::string_view text);

inline std::istringstream as_stream(const Bytes& data) {
    return std::istringstream(std::string(data.begin(), data.end()), std::ios::binary);
}

/// Unique scratch directory, removed with everything in it on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Writes @p data to path()/name and returns the full path.
    std::filesystem::path write(std::string_view name, std::span<const std::uint8_t> data) const;

private:
    std::filesystem::path path_;
};

} // namespace coverthumb::test

#endif // COVERTHUMB_TEST_FIXTURES_HPP
