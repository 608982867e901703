#include "apkindex.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <map>
#include <sstream>

namespace {

// Single letter keys of the index format
const std::map<char, std::string> key_names = {
    {'A', "arch"},
    {'D', "depends"},
    {'o', "origin"},
    {'P', "pkgname"},
    {'p', "provides"},
    {'k', "provider_priority"},
    {'t', "timestamp"},
    {'V', "version"},
};

std::string describe_block(const std::map<std::string, std::string>& block) {
    std::string out = "{";
    for (const auto& [key, value] : block) {
        if (out.size() > 1) out += ", ";
        out += key + ": '" + value + "'";
    }
    return out + "}";
}

std::vector<std::string> split_names(const std::map<std::string, std::string>& block, const std::string& key) {
    std::vector<std::string> ret;
    auto it = block.find(key);
    if (it == block.end()) return ret;
    for (const auto& value : split(it->second, ' ')) {
        ret.push_back(remove_operators(value));
    }
    return ret;
}

std::optional<std::string> optional_value(const std::map<std::string, std::string>& block, const std::string& key) {
    auto it = block.find(key);
    if (it == block.end()) return std::nullopt;
    return it->second;
}

} // anonymous namespace

PackageRecordPtr ProviderMap::find(std::string_view pkgname) const {
    for (const auto& [name, record] : entries_) {
        if (name == pkgname) return record;
    }
    return nullptr;
}

void ProviderMap::set(const std::string& pkgname, PackageRecordPtr record) {
    for (auto& entry : entries_) {
        if (entry.first == pkgname) {
            entry.second = std::move(record);
            return;
        }
    }
    entries_.emplace_back(pkgname, std::move(record));
}

std::vector<std::string> ProviderMap::names() const {
    std::vector<std::string> ret;
    ret.reserve(entries_.size());
    for (const auto& entry : entries_) ret.push_back(entry.first);
    return ret;
}

const ProviderMap* IndexView::find(std::string_view name) const {
    auto it = entries.find(std::string(name));
    if (it == entries.end() || it->second.empty()) return nullptr;
    return &it->second;
}

PackageRecordPtr IndexView::first(std::string_view name) const {
    const ProviderMap* providers = find(name);
    return providers ? providers->front().second : nullptr;
}

std::optional<PackageRecord> parse_next_block(const fs::path& path, const std::vector<std::string>& lines, size_t& start) {
    std::map<std::string, std::string> block;
    bool end_of_block_found = false;

    for (size_t i = start; i < lines.size(); ++i) {
        start = i + 1;
        const std::string& line = lines[i];
        if (line.empty()) {
            end_of_block_found = true;
            break;
        }
        if (line.size() < 2 || line[1] != ':') continue;

        auto key_it = key_names.find(line[0]);
        if (key_it == key_names.end()) continue;

        const std::string& key = key_it->second;
        if (block.contains(key)) {
            throw IndexParseError(string_format("error.index_key_twice", key, std::string(1, line[0]),
                                                describe_block(block), path.string()));
        }
        block[key] = line.substr(2);
    }

    if (!end_of_block_found) {
        if (!block.empty()) {
            throw IndexParseError(string_format("error.index_no_newline", path.string(), describe_block(block)));
        }
        return std::nullopt;
    }

    for (const char* key : {"arch", "pkgname", "version"}) {
        if (!block.contains(key)) {
            throw IndexParseError(string_format("error.index_key_missing", std::string(key),
                                                describe_block(block), path.string()));
        }
    }

    PackageRecord record;
    record.pkgname = block["pkgname"];
    record.version = block["version"];
    record.arch = block["arch"];
    record.depends = split_names(block, "depends");
    record.provides = split_names(block, "provides");
    record.origin = optional_value(block, "origin");
    record.timestamp = optional_value(block, "timestamp");
    if (auto priority = optional_value(block, "provider_priority")) {
        try {
            size_t pos = 0;
            record.provider_priority = std::stoi(*priority, &pos);
            if (pos != priority->size()) throw std::invalid_argument(*priority);
        } catch (const std::logic_error&) {
            throw IndexParseError(string_format("error.index_bad_priority", *priority,
                                                describe_block(block), path.string()));
        }
    }
    return record;
}

void add_block(IndexView& view, const PackageRecordPtr& record, const std::string& alias) {
    const std::string& name = alias.empty() ? record->pkgname : alias;

    PackageRecordPtr old;
    if (const ProviderMap* providers = view.find(name)) {
        old = view.multiple_providers ? providers->find(record->pkgname) : providers->front().second;
    }

    if (old && version_compare(old->version, record->version) == 1) {
        return;
    }

    ProviderMap& providers = view.entries[name];
    if (!view.multiple_providers) {
        providers.clear();
    }
    providers.set(record->pkgname, record);
}

std::vector<std::string> read_index_lines(const fs::path& path) {
    if (!is_tar_archive(path)) {
        return read_lines(path);
    }

    auto content = extract_file_from_archive(path, "APKINDEX");
    if (!content) {
        throw IndexParseError(string_format("error.index_member_missing", path.string()));
    }

    std::vector<std::string> lines;
    std::istringstream stream(*content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<PackageRecord> parse_blocks(const fs::path& path) {
    const auto lines = read_index_lines(path);
    std::vector<PackageRecord> ret;
    size_t start = 0;
    while (auto block = parse_next_block(path, lines, start)) {
        ret.push_back(std::move(*block));
    }
    return ret;
}

IndexView parse_index(const fs::path& path, bool multiple_providers) {
    IndexView view;
    view.multiple_providers = multiple_providers;

    const auto lines = read_index_lines(path);
    size_t start = 0;
    while (auto block = parse_next_block(path, lines, start)) {
        if (block->is_virtual()) {
            log_verbose(string_format("verbose.skip_virtual", block->pkgname, path.string()));
            continue;
        }

        auto record = std::make_shared<const PackageRecord>(std::move(*block));
        add_block(view, record);
        for (const auto& alias : record->provides) {
            add_block(view, record, alias);
        }
    }
    return view;
}
