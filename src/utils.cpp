#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    LogLevel log_level = LogLevel::NORMAL;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void set_log_level(LogLevel level) {
    log_level = level;
}

LogLevel get_log_level() {
    return log_level;
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix") + " ", COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_debug(std::string_view msg) {
    if (log_level < LogLevel::DEBUG) return;
    log_internal(get_string("debug.prefix") + " ", COLOR_BLUE, msg, std::cerr);
}

void log_verbose(std::string_view msg) {
    if (log_level < LogLevel::VERBOSE) return;
    log_internal(get_string("verbose.prefix") + " ", COLOR_BLUE, msg, std::cerr);
}

std::vector<std::string> split(std::string_view s, char delim, bool skip_empty) {
    std::vector<std::string> res;
    size_t start = 0, end = 0;
    while ((end = s.find(delim, start)) != std::string_view::npos) {
        if (!skip_empty || end > start) res.emplace_back(s.substr(start, end - start));
        start = end + 1;
    }
    if (!skip_empty || start < s.size()) res.emplace_back(s.substr(start));
    return res;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

std::string remove_operators(std::string_view entry) {
    // First operator found in this order wins, not the leftmost one.
    for (const char op : {'>', '=', '<', '~'}) {
        if (const auto pos = entry.find(op); pos != std::string_view::npos) {
            return std::string(entry.substr(0, pos));
        }
    }
    return std::string(entry);
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ApkmetaException(string_format("error.open_file_failed", path.string()));
    }
    std::vector<std::string> result;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        result.push_back(std::move(line));
    }
    return result;
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ApkmetaException(string_format("error.open_file_failed", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}
