#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_BLUE = "\033[1;34m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// NORMAL < DEBUG < VERBOSE
enum class LogLevel {
    NORMAL,
    DEBUG,
    VERBOSE
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_debug(std::string_view msg);
void log_verbose(std::string_view msg);

// String utilities
std::vector<std::string> split(std::string_view s, char delim, bool skip_empty = true);
std::string join(const std::vector<std::string>& parts, std::string_view sep);
std::string trim(std::string_view s);

// Cut a dependency or provides entry at its version operator: "so:libc.so=1" -> "so:libc.so"
std::string remove_operators(std::string_view entry);

// Filesystem utilities
std::vector<std::string> read_lines(const fs::path& path);
std::string read_file(const fs::path& path);
