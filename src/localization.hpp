#pragma once

#include <string>
#include <format>
#include <string_view>

// Load L10N_DIR/<lang>.txt for the language in $LANG (zh or en). Called once
// by main() and by every test fixture; later calls reload the table.
void init_localization();

// Message for `key`, or "[MISSING_STRING: key]" if no table has it
const std::string& get_string(const std::string& key);

// Message for `key` with its {} placeholders filled from args
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "apkmeta formatting error [key: " + key + "]: " + e.what();
    }
}
