#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path WORK_DIR;
extern std::filesystem::path APORTS_DIR;
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path L10N_DIR;

// Derived paths
extern std::filesystem::path REPOSITORIES_CONF;
extern std::filesystem::path PROVIDERS_CONF;

// Functions
void set_work_dir(const std::string& work_dir);
void set_aports_dir(const std::string& aports_dir);
void set_config_dir(const std::string& config_dir);
void set_l10n_dir(const std::string& l10n_dir);
void set_channel(const std::string& channel);
std::string get_channel();

void set_architecture(const std::string& arch); // Manually override architecture
std::string get_architecture();

// Chroot suffixes: "native" or "buildroot_<arch>"
std::string arch_from_suffix(const std::string& suffix);
std::filesystem::path chroot_dir(const std::string& suffix);
std::filesystem::path installed_db_path(const std::string& suffix);

std::vector<std::string> get_repository_urls();
std::map<std::string, std::string> get_selected_providers();

// All APKINDEX files of one architecture, local repository first.
std::vector<std::filesystem::path> apkindex_files(const std::string& arch);
