//
// Created by Giuseppe Francione on 03/12/25.
//

#include "../../include/byte_reader.hpp"
#include "../../include/cover_error.hpp"
#include <algorithm>
#include <array>
#include <string>

namespace coverthumb {

namespace {
constexpr std::size_t kReadChunkSize = 64 * 1024;
} // namespace

std::uint64_t stream_length(std::istream& in) {
    in.clear();
    in.seekg(0, std::ios::end);
    const std::streamoff end = in.tellg();
    if (!in || end < 0) {
        throw CoverError(ErrorKind::IoError, "cannot determine stream length");
    }
    in.seekg(0, std::ios::beg);
    if (!in) {
        throw CoverError(ErrorKind::IoError, "cannot rewind stream");
    }
    return static_cast<std::uint64_t>(end);
}

void read_exact_at(std::istream& in, const std::uint64_t offset, const std::span<std::uint8_t> out) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!in) {
        // some streams refuse to seek past the end; that is a short read, not an I/O failure
        if (offset > stream_length(in)) {
            throw CoverError(ErrorKind::ContainerError,
                             "short read: offset " + std::to_string(offset) + " is past the end of the stream");
        }
        throw CoverError(ErrorKind::IoError, "seek to offset " + std::to_string(offset) + " failed");
    }
    in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (in.bad()) {
        throw CoverError(ErrorKind::IoError, "read at offset " + std::to_string(offset) + " failed");
    }
    if (static_cast<std::size_t>(in.gcount()) != out.size()) {
        throw CoverError(ErrorKind::ContainerError,
                         "short read at offset " + std::to_string(offset) + ": wanted " +
                         std::to_string(out.size()) + " bytes, got " + std::to_string(in.gcount()));
    }
}

std::vector<std::uint8_t> read_up_to(std::istream& in, const std::size_t max_bytes) {
    std::vector<std::uint8_t> buf;
    std::array<char, kReadChunkSize> chunk{};
    while (buf.size() < max_bytes) {
        const std::size_t want = std::min(chunk.size(), max_bytes - buf.size());
        in.read(chunk.data(), static_cast<std::streamsize>(want));
        if (in.bad()) {
            throw CoverError(ErrorKind::IoError, "stream read failed");
        }
        const auto got = static_cast<std::size_t>(in.gcount());
        buf.insert(buf.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(got));
        if (got < want) {
            break;
        }
    }
    in.clear();
    return buf;
}

} // namespace coverthumb
