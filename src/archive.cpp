#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace fs = std::filesystem;

// Custom deleter for libarchive handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;

namespace {

ArchiveReadHandle open_tar(const fs::path& archive_path) {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw ApkmetaException(string_format("error.open_file_failed", archive_path.string()));
    }
    archive_read_support_filter_all(a.get());
    archive_read_support_format_tar(a.get());
    archive_read_support_format_gnutar(a.get());
    return a;
}

std::string archive_error(struct archive* a, const std::string& fallback_key) {
    const char* err = archive_error_string(a);
    return err ? err : get_string(fallback_key);
}

} // anonymous namespace

bool is_tar_archive(const fs::path& path) {
    ArchiveReadHandle a = open_tar(path);
    if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        return false;
    }
    struct archive_entry* entry;
    return archive_read_next_header(a.get(), &entry) == ARCHIVE_OK;
}

std::optional<std::string> extract_file_from_archive(const fs::path& archive_path, const std::string& internal_path) {
    ArchiveReadHandle a = open_tar(archive_path);

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw ApkmetaException(string_format("error.open_file_failed", archive_path.string()) + ": " +
                               archive_error(a.get(), "error.unknown"));
    }

    struct archive_entry* entry;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw ApkmetaException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                       archive_error(a.get(), "error.fatal_read"));
            }
            log_warning(archive_error(a.get(), "error.unknown"));
        }

        const char* entry_path = archive_entry_pathname(entry);
        std::string path = entry_path ? entry_path : "";
        if (path.starts_with("./")) path = path.substr(2);

        if (path != internal_path) {
            archive_read_data_skip(a.get());
            continue;
        }

        std::string content;
        if (archive_entry_size_is_set(entry)) {
            content.reserve(static_cast<size_t>(archive_entry_size(entry)));
        }
        char buffer[8192];
        la_ssize_t n;
        while ((n = archive_read_data(a.get(), buffer, sizeof(buffer))) > 0) {
            content.append(buffer, static_cast<size_t>(n));
        }
        if (n < 0) {
            throw ApkmetaException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                   archive_error(a.get(), "error.data_block_read"));
        }
        return content;
    }

    return std::nullopt;
}
