//
// Created by Giuseppe Francione on 03/12/25.
//

/**
 * @file archive_reader.hpp
 * @brief Random-access reading of zip/RAR entries from a seekable stream via libarchive.
 */

#ifndef COVERTHUMB_ARCHIVE_READER_HPP
#define COVERTHUMB_ARCHIVE_READER_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct archive;

namespace coverthumb {

/**
 * @brief Container formats an ArchiveReader accepts.
 */
enum class ArchiveFlavor {
    Zip,      ///< zip only (EPUB)
    ZipOrRar  ///< zip, RAR and RAR5 (CBZ/CBR)
};

/**
 * @brief One regular-file entry of an archive.
 */
struct ArchiveEntry {
    std::string name;   ///< path inside the archive, '/' separated
    std::uint64_t size; ///< declared uncompressed size (0 if unknown)
};

/**
 * @brief Reads archive entries directly from a std::istream.
 *
 * The entry list is read once, at construction. Every read() re-opens the
 * archive over the rewound stream, so the stream must stay alive and
 * seekable for the lifetime of the reader. Directories are not listed.
 */
class ArchiveReader {
public:
    ///< Entries larger than this are refused.
    static constexpr std::uint64_t kMaxEntrySize = 64ULL * 1024 * 1024;

    /**
     * @brief Opens the archive and lists its entries.
     * @throws CoverError(ContainerError) if libarchive cannot open or walk it.
     */
    explicit ArchiveReader(std::istream& in, ArchiveFlavor flavor = ArchiveFlavor::Zip);

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    /// @return Regular-file entries in archive order.
    [[nodiscard]] const std::vector<ArchiveEntry>& entries() const noexcept { return entries_; }

    /// @return True if an entry with exactly this name exists.
    [[nodiscard]] bool contains(std::string_view name) const;

    /**
     * @brief Reads the full contents of the named entry.
     * @return The bytes, or std::nullopt if no such entry exists.
     * @throws CoverError(ContainerError) on a corrupt entry or one above kMaxEntrySize.
     */
    [[nodiscard]] std::optional<std::vector<std::uint8_t>> read(std::string_view name);

    /**
     * @brief Reads the named entry as text.
     */
    [[nodiscard]] std::optional<std::string> read_text(std::string_view name);

    /**
     * @brief State shared with the libarchive read callbacks.
     */
    struct StreamSource {
        std::istream* in = nullptr;
        std::array<char, 64 * 1024> buffer{};
    };

private:
    struct archive* open_archive();

    std::istream& in_;
    ArchiveFlavor flavor_;
    StreamSource source_;
    std::vector<ArchiveEntry> entries_;
};

} // namespace coverthumb

#endif // COVERTHUMB_ARCHIVE_READER_HPP
