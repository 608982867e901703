#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>
#include <unordered_map>
#include <filesystem>

// One block of an APKINDEX or of apk's installed database.
struct PackageRecord {
    std::string pkgname;
    std::string version;
    std::string arch;
    std::vector<std::string> depends;  // names only, version operators cut off
    std::vector<std::string> provides; // names only, version operators cut off
    std::optional<std::string> origin;
    std::optional<std::string> timestamp;
    std::optional<int> provider_priority;

    // Virtual packages (e.g. created by "apk add --virtual") have no timestamp
    bool is_virtual() const { return !timestamp.has_value(); }
};

using PackageRecordPtr = std::shared_ptr<const PackageRecord>;

// Providers of one name, keyed by the providing pkgname, in the order they
// were added. Replacing an existing provider keeps its position.
class ProviderMap {
public:
    using Entry = std::pair<std::string, PackageRecordPtr>;

    PackageRecordPtr find(std::string_view pkgname) const;
    bool contains(std::string_view pkgname) const { return find(pkgname) != nullptr; }
    void set(const std::string& pkgname, PackageRecordPtr record);
    void clear() { entries_.clear(); }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<std::string> names() const;

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }
    const Entry& front() const { return entries_.front(); }

private:
    std::vector<Entry> entries_;
};

// Parsed index: every pkgname and every "provides" entry maps to its
// providers. With multiple_providers=false (installed database) each name has
// exactly one provider.
struct IndexView {
    bool multiple_providers = true;
    std::unordered_map<std::string, ProviderMap> entries;

    const ProviderMap* find(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name) != nullptr; }
    // Single provider mode accessor, also usable in multiple provider mode
    PackageRecordPtr first(std::string_view name) const;
    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
};

// Parse the block starting at lines[start]. Advances start past the blank
// line that ends the block. Returns std::nullopt when no blocks are left.
// Throws IndexParseError for duplicate keys, missing required keys and a last
// block without a terminating blank line.
std::optional<PackageRecord> parse_next_block(const std::filesystem::path& path, const std::vector<std::string>& lines, size_t& start);

// Register a record under alias (defaults to its pkgname). An existing entry
// with a higher version is kept.
void add_block(IndexView& view, const PackageRecordPtr& record, const std::string& alias = "");

// Lines of the "APKINDEX" member of an APKINDEX.tar.gz, or of a plain file
std::vector<std::string> read_index_lines(const std::filesystem::path& path);

// All blocks of an index file, without aliasing or removing lower versions
std::vector<PackageRecord> parse_blocks(const std::filesystem::path& path);

// Parse a whole index file, skipping virtual packages. No caching, see
// IndexCache::parse().
IndexView parse_index(const std::filesystem::path& path, bool multiple_providers = true);
