#pragma once

#include <string>
#include <optional>
#include <filesystem>

// True when the file is a (possibly compressed) tar archive.
bool is_tar_archive(const std::filesystem::path& path);

// Read one member of a tar archive into memory. Returns std::nullopt when the
// archive has no such member.
std::optional<std::string> extract_file_from_archive(const std::filesystem::path& archive_path, const std::string& internal_path);
