#include "index_cache.hpp"
#include "localization.hpp"
#include "utils.hpp"

std::optional<fs::file_time_type> stat_last_write_time(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    auto lastmod = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return lastmod;
}

IndexCache::IndexCache() : stat_(stat_last_write_time) {}

IndexCache::IndexCache(StatFunction stat) : stat_(std::move(stat)) {}

std::string IndexCache::cache_key(const fs::path& path) {
    return fs::absolute(path).lexically_normal().string();
}

std::shared_ptr<const IndexView> IndexCache::parse(const fs::path& path, bool multiple_providers) {
    const auto lastmod = stat_(path);
    if (!lastmod) {
        log_verbose(string_format("verbose.index_not_found", path.string()));
        auto empty = std::make_shared<IndexView>();
        empty->multiple_providers = multiple_providers;
        return empty;
    }

    const std::string key = cache_key(path);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (it->second.lastmod == *lastmod) {
                const auto& cached = multiple_providers ? it->second.multiple : it->second.single;
                if (cached) return cached;
            } else {
                log_verbose(string_format("verbose.clear_index_cache", key));
                entries_.erase(it);
            }
        }
    }

    // Parse outside of the lock, it reads and decompresses the whole file
    auto view = std::make_shared<const IndexView>(parse_index(path, multiple_providers));

    std::lock_guard<std::mutex> lock(mtx_);
    auto [it, inserted] = entries_.try_emplace(key, Entry{*lastmod, nullptr, nullptr});
    if (!inserted && it->second.lastmod != *lastmod) {
        it->second = Entry{*lastmod, nullptr, nullptr};
    }
    (multiple_providers ? it->second.multiple : it->second.single) = view;
    return view;
}

bool IndexCache::clear(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::string key = cache_key(path);
    if (entries_.erase(key) > 0) {
        log_verbose(string_format("verbose.clear_index_cache", key));
        return true;
    }
    log_verbose(string_format("verbose.clear_index_cache_noop", key));
    return false;
}

void IndexCache::clear_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
}

bool IndexCache::is_cached(const fs::path& path, bool multiple_providers) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(cache_key(path));
    if (it == entries_.end()) return false;
    return static_cast<bool>(multiple_providers ? it->second.multiple : it->second.single);
}
