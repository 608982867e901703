#pragma once

#include "apkindex.hpp"

#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <unordered_map>
#include <filesystem>

// Parsed index files, keyed by path and invalidated when the file's
// modification time changes.
class IndexCache {
public:
    // Returns the modification time, or std::nullopt if the file does not exist
    using StatFunction = std::function<std::optional<std::filesystem::file_time_type>(const std::filesystem::path&)>;

    IndexCache();
    explicit IndexCache(StatFunction stat);

    IndexCache(const IndexCache&) = delete;
    IndexCache& operator=(const IndexCache&) = delete;

    // A missing file is not an error: there are simply no binary packages for
    // that architecture, so an empty view is returned.
    std::shared_ptr<const IndexView> parse(const std::filesystem::path& path, bool multiple_providers = true);

    // Drop all views of one file. Returns false if nothing was cached.
    bool clear(const std::filesystem::path& path);
    void clear_all();

    bool is_cached(const std::filesystem::path& path, bool multiple_providers) const;

private:
    struct Entry {
        std::filesystem::file_time_type lastmod;
        std::shared_ptr<const IndexView> multiple;
        std::shared_ptr<const IndexView> single;
    };

    static std::string cache_key(const std::filesystem::path& path);

    StatFunction stat_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::mutex mtx_;
};

std::optional<std::filesystem::file_time_type> stat_last_write_time(const std::filesystem::path& path);
