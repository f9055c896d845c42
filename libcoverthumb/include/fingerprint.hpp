//
// Created by Giuseppe Francione on 08/12/25.
//

/**
 * @file fingerprint.hpp
 * @brief Cache key derived from sampled file content.
 *
 * The digest is MD5 over the extension, the requested size as a 32-bit
 * little-endian integer, and 1 KiB windows taken at offsets 256, 1024,
 * 4096, 16384, ... (1024 << 2i for i = 0..10). Files that differ only
 * outside those windows share a key; that is an accepted approximation.
 */

#ifndef COVERTHUMB_FINGERPRINT_HPP
#define COVERTHUMB_FINGERPRINT_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace coverthumb {

inline constexpr std::uint64_t kFirstWindowOffset = 256;
inline constexpr std::uint64_t kWindowStep = 1024;
inline constexpr std::uint64_t kWindowSize = 1024;
inline constexpr int kWindowCount = 11;

/**
 * @brief Computes "<md5-hex>.png" for a stream.
 * @param in Seekable binary stream.
 * @param extension Normalised extension (lowercase, no dot).
 * @param requested_size Thumbnail edge in pixels.
 * @throws CoverError(IoError) if the stream cannot be read.
 */
[[nodiscard]] std::string compute_cache_key(std::istream& in, std::string_view extension,
                                            std::uint32_t requested_size);

/**
 * @brief Computes the cache key of a file on disk.
 * @throws CoverError(IoError) if the file cannot be opened or read.
 */
[[nodiscard]] std::string compute_cache_key(const std::filesystem::path& path, std::string_view extension,
                                            std::uint32_t requested_size);

} // namespace coverthumb

#endif // COVERTHUMB_FINGERPRINT_HPP
