#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <fstream>
#include <unordered_map>
#include <cstdlib>
#include <string>

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    bool load_strings(const std::string& lang) {
        const fs::path file_path = L10N_DIR / (lang + ".txt");
        std::ifstream file(file_path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#') continue;
            if (line.back() == '\r') line.pop_back();
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
        return true;
    }
}

void init_localization() {
    translations.clear();
    const char* lang_env = std::getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).starts_with("zh")) {
        lang = "zh";
    }
    if (load_strings(lang)) return;
    if (lang != "en" && load_strings("en")) {
        log_warning("Could not open localization file for " + lang + ", falling back to English.");
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
