//
// Created by Giuseppe Francione on 13/11/25.
//

#ifndef COVERTHUMB_FILE_UTILS_HPP
#define COVERTHUMB_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace coverthumb {

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };

    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @param path File to read.
     * @param max_bytes Files larger than this are not read.
     * @return The contents, or std::nullopt if the file is missing,
     *         unreadable or too large.
     */
    std::optional<std::vector<std::uint8_t>> read_file(const std::filesystem::path &path,
                                                       std::uintmax_t max_bytes);

    /**
     * @brief Writes a file so that readers never observe partial content.
     *
     * Data goes to "<name>.<random>.tmp" beside the target, which is then
     * renamed over it. On any failure the temporary file is removed.
     *
     * @param target Final path.
     * @param data Bytes to write.
     * @param tag The logger tag used for failures.
     * @return true on success, false if the file could not be written.
     */
    bool write_file_atomic(const std::filesystem::path &target,
                           std::span<const std::uint8_t> data,
                           std::string_view tag = "file_utils");
} // namespace coverthumb

#endif // COVERTHUMB_FILE_UTILS_HPP
