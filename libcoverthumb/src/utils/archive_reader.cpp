//
// Created by Giuseppe Francione on 03/12/25.
//

#include "../../include/archive_reader.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <array>
#include <cstdio>
#include <memory>
#include <string>

namespace coverthumb {

namespace {

constexpr std::string_view kTag = "libarchive";

struct ArchiveDeleter {
    void operator()(archive* a) const { if (a) archive_read_free(a); }
};
using unique_archive = std::unique_ptr<archive, ArchiveDeleter>;

la_ssize_t stream_read(archive*, void* client_data, const void** buffer) {
    auto* src = static_cast<ArchiveReader::StreamSource*>(client_data);
    src->in->read(src->buffer.data(), static_cast<std::streamsize>(src->buffer.size()));
    if (src->in->bad()) return -1;
    const std::streamsize got = src->in->gcount();
    if (src->in->eof()) src->in->clear();
    *buffer = src->buffer.data();
    return static_cast<la_ssize_t>(got);
}

la_int64_t stream_seek(archive*, void* client_data, const la_int64_t offset, const int whence) {
    auto* src = static_cast<ArchiveReader::StreamSource*>(client_data);
    std::ios::seekdir dir = std::ios::beg;
    if (whence == SEEK_CUR) dir = std::ios::cur;
    else if (whence == SEEK_END) dir = std::ios::end;
    src->in->clear();
    src->in->seekg(static_cast<std::streamoff>(offset), dir);
    if (!*src->in) return ARCHIVE_FATAL;
    return static_cast<la_int64_t>(src->in->tellg());
}

la_int64_t stream_skip(archive*, void* client_data, const la_int64_t request) {
    auto* src = static_cast<ArchiveReader::StreamSource*>(client_data);
    src->in->clear();
    const std::streamoff before = src->in->tellg();
    src->in->seekg(static_cast<std::streamoff>(request), std::ios::cur);
    if (!*src->in) return 0;
    return static_cast<la_int64_t>(src->in->tellg() - before);
}

std::string error_of(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

bool is_regular(archive_entry* entry) {
    const char* name = archive_entry_pathname(entry);
    if (!name || !*name) return false;
    if (archive_entry_filetype(entry) == AE_IFDIR) return false;
    return std::string_view(name).back() != '/';
}

} // namespace

ArchiveReader::ArchiveReader(std::istream& in, const ArchiveFlavor flavor)
    : in_(in), flavor_(flavor) {
    source_.in = &in_;

    const unique_archive a(open_archive());
    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(a.get()), kTag);
        }
        if (is_regular(entry)) {
            const std::uint64_t size = archive_entry_size_is_set(entry)
                ? static_cast<std::uint64_t>(archive_entry_size(entry)) : 0;
            entries_.push_back({archive_entry_pathname(entry), size});
        }
        archive_read_data_skip(a.get());
    }
    if (r != ARCHIVE_EOF) {
        const std::string msg = "cannot list archive entries: " + error_of(a.get());
        Logger::log(LogLevel::Error, msg, kTag);
        throw CoverError(ErrorKind::ContainerError, msg);
    }
}

archive* ArchiveReader::open_archive() {
    in_.clear();
    in_.seekg(0, std::ios::beg);
    if (!in_) {
        throw CoverError(ErrorKind::IoError, "cannot rewind archive stream");
    }

    unique_archive a(archive_read_new());
    if (!a) {
        throw CoverError(ErrorKind::ContainerError, "archive_read_new failed");
    }
    archive_read_support_format_zip(a.get());
    if (flavor_ == ArchiveFlavor::ZipOrRar) {
        archive_read_support_format_rar(a.get());
        archive_read_support_format_rar5(a.get());
    }
    archive_read_set_options(a.get(), "hdrcharset=UTF-8");

    archive_read_set_read_callback(a.get(), stream_read);
    archive_read_set_seek_callback(a.get(), stream_seek);
    archive_read_set_skip_callback(a.get(), stream_skip);
    archive_read_set_callback_data(a.get(), &source_);

    const int r = archive_read_open1(a.get());
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(a.get()), kTag);
    } else if (r != ARCHIVE_OK) {
        const std::string msg = "archive_read_open1: " + error_of(a.get());
        Logger::log(LogLevel::Error, msg, kTag);
        throw CoverError(ErrorKind::ContainerError, msg);
    }
    return a.release();
}

bool ArchiveReader::contains(const std::string_view name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return true;
    }
    return false;
}

std::optional<std::vector<std::uint8_t>> ArchiveReader::read(const std::string_view name) {
    if (!contains(name)) return std::nullopt;

    const unique_archive a(open_archive());
    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char* current = archive_entry_pathname(entry);
        if (!current || name != current || !is_regular(entry)) {
            archive_read_data_skip(a.get());
            continue;
        }

        if (archive_entry_size_is_set(entry) &&
            static_cast<std::uint64_t>(archive_entry_size(entry)) > kMaxEntrySize) {
            throw CoverError(ErrorKind::ContainerError,
                             "archive entry too large: " + std::string(name));
        }

        std::vector<std::uint8_t> data;
        std::array<std::uint8_t, 64 * 1024> chunk{};
        la_ssize_t size_read;
        while ((size_read = archive_read_data(a.get(), chunk.data(), chunk.size())) > 0) {
            if (data.size() + static_cast<std::size_t>(size_read) > kMaxEntrySize) {
                throw CoverError(ErrorKind::ContainerError,
                                 "archive entry too large: " + std::string(name));
            }
            data.insert(data.end(), chunk.begin(), chunk.begin() + size_read);
        }
        if (size_read < 0) {
            const std::string msg = "error reading " + std::string(name) + ": " + error_of(a.get());
            Logger::log(LogLevel::Error, msg, kTag);
            throw CoverError(ErrorKind::ContainerError, msg);
        }
        return data;
    }
    if (r != ARCHIVE_EOF) {
        throw CoverError(ErrorKind::ContainerError, "error during iteration: " + error_of(a.get()));
    }
    return std::nullopt;
}

std::optional<std::string> ArchiveReader::read_text(const std::string_view name) {
    auto bytes = read(name);
    if (!bytes) return std::nullopt;
    return std::string(bytes->begin(), bytes->end());
}

} // namespace coverthumb
