#include "config.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/utsname.h>

#include <cstdlib>
#include <unordered_map>

#ifndef APKMETA_CONF_DIR
#define APKMETA_CONF_DIR "/etc/apkmeta"
#endif

#ifndef APKMETA_L10N_DIR
#define APKMETA_L10N_DIR "/usr/share/apkmeta/l10n"
#endif

namespace {
    fs::path default_work_dir() {
        const char* home = std::getenv("HOME");
        return fs::path(home ? home : "/root") / ".local/var/pmbootstrap";
    }

    std::string g_channel = "edge";
    std::string g_architecture_override;
    bool g_aports_overridden = false;
}

fs::path WORK_DIR = default_work_dir();
fs::path APORTS_DIR = WORK_DIR / "cache_git/pmaports";
fs::path CONFIG_DIR = APKMETA_CONF_DIR;
fs::path L10N_DIR = APKMETA_L10N_DIR;

fs::path REPOSITORIES_CONF = CONFIG_DIR / "repositories";
fs::path PROVIDERS_CONF = CONFIG_DIR / "providers";

void set_work_dir(const std::string& work_dir) {
    WORK_DIR = fs::path(work_dir).lexically_normal();
    if (!g_aports_overridden) {
        APORTS_DIR = WORK_DIR / "cache_git/pmaports";
    }
}

void set_aports_dir(const std::string& aports_dir) {
    APORTS_DIR = fs::path(aports_dir).lexically_normal();
    g_aports_overridden = true;
}

void set_config_dir(const std::string& config_dir) {
    CONFIG_DIR = fs::path(config_dir).lexically_normal();
    REPOSITORIES_CONF = CONFIG_DIR / "repositories";
    PROVIDERS_CONF = CONFIG_DIR / "providers";
}

void set_l10n_dir(const std::string& l10n_dir) {
    L10N_DIR = l10n_dir;
}

void set_channel(const std::string& channel) {
    g_channel = channel;
}

std::string get_channel() {
    return g_channel;
}

void set_architecture(const std::string& arch) {
    g_architecture_override = arch;
}

std::string get_architecture() {
    if (!g_architecture_override.empty()) {
        return g_architecture_override;
    }

    struct utsname buf;
    if (uname(&buf) != 0) {
        throw ApkmetaException(get_string("error.get_arch_failed"));
    }
    static const std::unordered_map<std::string, std::string> mapping = {
        {"i686", "x86"},
        {"x86_64", "x86_64"},
        {"aarch64", "aarch64"},
        {"arm64", "aarch64"},
        {"armv6l", "armhf"},
        {"armv7l", "armv7"},
        {"armv8l", "armv7"},
    };
    auto it = mapping.find(buf.machine);
    if (it == mapping.end()) {
        throw ApkmetaException(string_format("error.unsupported_arch", std::string(buf.machine)));
    }
    return it->second;
}

std::string arch_from_suffix(const std::string& suffix) {
    if (suffix == "native") {
        return get_architecture();
    }
    if (suffix.starts_with("buildroot_") && suffix.size() > 10) {
        return suffix.substr(10);
    }
    throw ApkmetaException(string_format("error.invalid_suffix", suffix));
}

fs::path chroot_dir(const std::string& suffix) {
    return WORK_DIR / ("chroot_" + suffix);
}

fs::path installed_db_path(const std::string& suffix) {
    return chroot_dir(suffix) / "lib/apk/db/installed";
}

std::vector<std::string> get_repository_urls() {
    std::vector<std::string> urls;
    if (!fs::exists(REPOSITORIES_CONF)) {
        log_verbose(string_format("verbose.no_repositories_conf", REPOSITORIES_CONF.string()));
        return urls;
    }
    for (const auto& line : read_lines(REPOSITORIES_CONF)) {
        std::string url = trim(line);
        if (url.empty() || url[0] == '#') continue;
        urls.push_back(std::move(url));
    }
    return urls;
}

std::map<std::string, std::string> get_selected_providers() {
    std::map<std::string, std::string> selected;
    if (!fs::exists(PROVIDERS_CONF)) {
        return selected;
    }
    for (const auto& line : read_lines(PROVIDERS_CONF)) {
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;
        const auto pos = entry.find('=');
        if (pos == std::string::npos) {
            throw ApkmetaException(string_format("error.invalid_providers_line", PROVIDERS_CONF.string(), entry));
        }
        selected[trim(entry.substr(0, pos))] = trim(entry.substr(pos + 1));
    }
    return selected;
}

std::vector<fs::path> apkindex_files(const std::string& arch) {
    std::vector<fs::path> ret;
    ret.push_back(WORK_DIR / "packages" / g_channel / arch / "APKINDEX.tar.gz");
    for (const auto& url : get_repository_urls()) {
        ret.push_back(WORK_DIR / ("cache_apk_" + arch) / ("APKINDEX." + apk_repo_hash(url) + ".tar.gz"));
    }
    return ret;
}
