#include "bundle.h"

#include "cli_parse.h"

#include <ctime>
#include <utility>

#include <archive.h>
#include <archive_entry.h>

namespace gang::core {

namespace {

std::string archive_message(struct archive* a) {
    const char* message = archive_error_string(a);
    return message != nullptr ? message : "unknown error";
}

bool write_entry(struct archive* a, const ArchiveEntry& item, time_t mtime, Error& error) {
    struct archive_entry* entry = archive_entry_new();
    if (!entry) {
        return fail(error, ErrorCode::Render, "Failed to create archive entry");
    }

    archive_entry_set_pathname(entry, item.name.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(item.data.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_mtime(entry, mtime, 0);

    if (archive_write_header(a, entry) != ARCHIVE_OK) {
        std::string message = "Failed to write archive header: " + archive_message(a);
        archive_entry_free(entry);
        return fail(error, ErrorCode::Render, message);
    }

    if (!item.data.empty()
        && archive_write_data(a, item.data.data(), item.data.size()) != static_cast<la_ssize_t>(item.data.size())) {
        std::string message = "Failed to write archive data: " + archive_message(a);
        archive_entry_free(entry);
        return fail(error, ErrorCode::Render, message);
    }

    archive_entry_free(entry);
    return true;
}

} // namespace

bool parse_archive_format(const std::string& value, ArchiveFormat& out) {
    const std::string lower = to_lower_copy(value);
    if (lower == "zip") {
        out = ArchiveFormat::Zip;
        return true;
    }
    if (lower == "tar") {
        out = ArchiveFormat::Tar;
        return true;
    }
    return false;
}

const char* archive_extension(ArchiveFormat format) {
    return format == ArchiveFormat::Zip ? "zip" : "tar";
}

bool write_archive(const std::vector<ArchiveEntry>& entries,
                   ArchiveFormat format,
                   std::vector<char>& out,
                   Error& error) {
    struct archive* a = archive_write_new();
    if (!a) {
        return fail(error, ErrorCode::Render, "Failed to create archive");
    }

    const int format_rc = format == ArchiveFormat::Zip
        ? archive_write_set_format_zip(a)
        : archive_write_set_format_pax_restricted(a);
    if (format_rc != ARCHIVE_OK) {
        std::string message = "Failed to set archive format: " + archive_message(a);
        archive_write_free(a);
        return fail(error, ErrorCode::Render, message);
    }

    if (archive_write_add_filter_none(a) != ARCHIVE_OK) {
        std::string message = "Failed to set compression: " + archive_message(a);
        archive_write_free(a);
        return fail(error, ErrorCode::Render, message);
    }

    std::vector<char> archive_buffer;
    auto write_callback = [](struct archive*, void* client_data, const void* buffer, size_t length) -> la_ssize_t {
        auto* buf = static_cast<std::vector<char>*>(client_data);
        const char* data = static_cast<const char*>(buffer);
        buf->insert(buf->end(), data, data + length);
        return static_cast<la_ssize_t>(length);
    };

    if (archive_write_open(a, &archive_buffer, nullptr, write_callback, nullptr) != ARCHIVE_OK) {
        std::string message = "Failed to open memory for archive: " + archive_message(a);
        archive_write_free(a);
        return fail(error, ErrorCode::Render, message);
    }

    const time_t now = time(nullptr);
    for (const ArchiveEntry& item : entries) {
        if (!write_entry(a, item, now, error)) {
            archive_write_free(a);
            return false;
        }
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        std::string message = "Failed to close archive: " + archive_message(a);
        archive_write_free(a);
        return fail(error, ErrorCode::Render, message);
    }
    archive_write_free(a);

    out = std::move(archive_buffer);
    return true;
}

} // namespace gang::core
