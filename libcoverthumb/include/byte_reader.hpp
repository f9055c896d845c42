//
// Created by Giuseppe Francione on 03/12/25.
//

/**
 * @file byte_reader.hpp
 * @brief Length-checked reads from seekable streams and big-endian decoding.
 */

#ifndef COVERTHUMB_BYTE_READER_HPP
#define COVERTHUMB_BYTE_READER_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <vector>

namespace coverthumb {

/**
 * @brief Total length of a seekable stream, leaving it positioned at 0.
 * @throws CoverError(IoError) if the stream cannot be seeked.
 */
std::uint64_t stream_length(std::istream& in);

/**
 * @brief Reads exactly out.size() bytes at an absolute offset.
 * @throws CoverError(IoError) on a stream failure,
 *         CoverError(ContainerError) when the stream ends early.
 */
void read_exact_at(std::istream& in, std::uint64_t offset, std::span<std::uint8_t> out);

/**
 * @brief Reads at most max_bytes from the current position.
 * @throws CoverError(IoError) on a stream failure. Hitting the end is not an error.
 */
std::vector<std::uint8_t> read_up_to(std::istream& in, std::size_t max_bytes);

inline std::uint16_t load_be16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

inline std::uint32_t load_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8)  |
           (static_cast<std::uint32_t>(p[3]));
}

} // namespace coverthumb

#endif // COVERTHUMB_BYTE_READER_HPP
