//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/mobi_extractor.hpp"
#include "../../include/byte_reader.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <initializer_list>
#include <string>
#include <vector>

namespace coverthumb {

namespace {

constexpr std::string_view kTag = "MobiExtractor";
constexpr std::uint64_t kMaxRecordSize = 64ULL * 1024 * 1024;

[[noreturn]] void fail(const std::string& msg) {
    Logger::log(LogLevel::Error, msg, kTag);
    throw CoverError(ErrorKind::ContainerError, msg);
}

bool has_raster_signature(const CoverBytes& data) {
    const auto starts_with = [&data](std::initializer_list<std::uint8_t> sig) {
        return data.size() >= sig.size() && std::equal(sig.begin(), sig.end(), data.begin());
    };
    return starts_with({0xFF, 0xD8, 0xFF}) ||
           starts_with({0x89, 0x50, 0x4E, 0x47}) ||
           starts_with({'G', 'I', 'F'});
}

} // namespace

std::optional<CoverBytes> MobiExtractor::extract(std::istream& in, [[maybe_unused]] std::uint32_t requested_size) {
    const std::uint64_t length = stream_length(in);

    // --- palm database header and record table ---
    std::array<std::uint8_t, kPdbHeaderSize> pdb{};
    read_exact_at(in, 0, pdb);
    if (std::memcmp(pdb.data() + 60, "BOOKMOBI", 8) != 0) {
        fail("Not a Mobipocket database (type/creator mismatch)");
    }

    const std::uint16_t record_count = load_be16(pdb.data() + 76);
    if (record_count == 0) {
        fail("Mobipocket database has no records");
    }

    std::vector<std::uint8_t> table(static_cast<std::size_t>(record_count) * 8);
    read_exact_at(in, kPdbHeaderSize, table);

    std::vector<std::uint64_t> offsets(record_count);
    for (std::size_t i = 0; i < record_count; ++i) {
        offsets[i] = load_be32(table.data() + i * 8);
        if (offsets[i] > length || (i > 0 && offsets[i] < offsets[i - 1])) {
            fail("Inconsistent record table at entry " + std::to_string(i));
        }
    }

    // --- MOBI header in record 0 ---
    const std::uint64_t record0 = offsets[0];
    std::array<std::uint8_t, kMobiHeaderSize> mobi{};
    read_exact_at(in, record0, mobi);
    if (std::memcmp(mobi.data() + 16, "MOBI", 4) != 0) {
        fail("MOBI header magic not found in record 0");
    }

    const std::uint32_t header_length = load_be32(mobi.data() + 20);
    const std::uint32_t first_image = load_be32(mobi.data() + 108);
    const std::uint32_t exth_flags = load_be32(mobi.data() + 128);
    if ((exth_flags & kExthFlag) == 0) {
        fail("No EXTH block (flags " + std::to_string(exth_flags) + ")");
    }

    // --- EXTH block ---
    const std::uint64_t exth_offset = record0 + 16 + header_length;
    std::array<std::uint8_t, 12> exth{};
    read_exact_at(in, exth_offset, exth);
    if (std::memcmp(exth.data(), "EXTH", 4) != 0) {
        fail("EXTH magic not found");
    }
    const std::uint32_t exth_count = load_be32(exth.data() + 8);

    std::optional<std::uint32_t> cover_offset;
    std::uint64_t pos = exth_offset + 12;
    for (std::uint32_t i = 0; i < exth_count; ++i) {
        std::array<std::uint8_t, 8> rec{};
        read_exact_at(in, pos, rec);
        const std::uint32_t type = load_be32(rec.data());
        const std::uint32_t rec_len = load_be32(rec.data() + 4);
        // a length below the header size carries no payload; only the header is consumed
        if (rec_len < 8) {
            Logger::log(LogLevel::Warning,
                        "EXTH record " + std::to_string(i) + " has length " + std::to_string(rec_len), kTag);
        }
        // the last cover-offset record wins
        if (type == kExthCoverOffset && rec_len >= 12) {
            std::array<std::uint8_t, 4> value{};
            read_exact_at(in, pos + 8, value);
            cover_offset = load_be32(value.data());
        }
        pos += std::max<std::uint32_t>(rec_len, 8);
    }

    const std::uint64_t index = static_cast<std::uint64_t>(first_image) + cover_offset.value_or(0);
    if (index >= record_count) {
        Logger::log(LogLevel::Warning,
                    "Cover record " + std::to_string(index) + " outside record table", kTag);
        return std::nullopt;
    }

    const std::uint64_t start = offsets[index];
    const std::uint64_t end = index + 1 < record_count ? offsets[index + 1] : length;
    if (end <= start) {
        Logger::log(LogLevel::Warning, "Cover record is empty", kTag);
        return std::nullopt;
    }
    if (end - start > kMaxRecordSize) {
        fail("Cover record too large");
    }

    CoverBytes data(static_cast<std::size_t>(end - start));
    read_exact_at(in, start, data);
    if (!has_raster_signature(data)) {
        Logger::log(LogLevel::Warning,
                    "Record " + std::to_string(index) + " is not a JPEG, PNG or GIF image", kTag);
        return std::nullopt;
    }

    Logger::log(LogLevel::Debug, "Cover is record " + std::to_string(index), kTag);
    return data;
}

} // namespace coverthumb
