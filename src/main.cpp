#include "apkindex.hpp"
#include "aports.hpp"
#include "config.hpp"
#include "depends.hpp"
#include "exception.hpp"
#include "index_cache.hpp"
#include "localization.hpp"
#include "providers.hpp"
#include "utils.hpp"
#include "version.hpp"
#include "cxxopts.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    for (const char* key : {"info.compare_desc", "info.validate_desc", "info.check_desc", "info.index_desc",
                            "info.blocks_desc", "info.providers_desc", "info.package_desc", "info.depends_desc",
                            "info.find_recipe_desc"}) {
        std::cerr << get_string(key) << std::endl;
    }
}

void pre_operation_check(const std::vector<std::string>& args, std::function<void()> print_usage_func, size_t min,
                         std::optional<size_t> max = std::nullopt) {
    if (args.size() < min || (max.has_value() && args.size() > max.value())) {
        print_usage_func();
        throw ApkmetaException(get_string("error.invalid_arg_count"));
    }
}

std::string format_record(const PackageRecord& record) {
    return record.pkgname + "-" + record.version;
}

void print_index(const IndexView& view) {
    std::vector<std::string> names;
    names.reserve(view.size());
    for (const auto& [name, providers] : view.entries) names.push_back(name);
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        std::vector<std::string> providers;
        for (const auto& [pkgname, record] : *view.find(name)) {
            providers.push_back(format_record(*record));
        }
        std::cout << name << ": " << join(providers, ", ") << std::endl;
    }
}

void print_record(const PackageRecord& record) {
    std::cout << format_record(record) << " (" << record.arch << ")" << std::endl;
    if (!record.depends.empty()) std::cout << "  depends: " << join(record.depends, " ") << std::endl;
    if (!record.provides.empty()) std::cout << "  provides: " << join(record.provides, " ") << std::endl;
    if (record.provider_priority) std::cout << "  provider_priority: " << *record.provider_priority << std::endl;
    if (record.is_virtual()) std::cout << "  " << get_string("info.virtual_package") << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("d,debug", get_string("help.debug"), cxxopts::value<bool>()->default_value("false"))
            ("w,work", get_string("help.work_dir"), cxxopts::value<std::string>())
            ("aports", get_string("help.aports_dir"), cxxopts::value<std::string>())
            ("config-dir", get_string("help.config_dir"), cxxopts::value<std::string>())
            ("channel", get_string("help.channel"), cxxopts::value<std::string>())
            ("arch", get_string("help.target_arch"), cxxopts::value<std::string>())
            ("s,suffix", get_string("help.suffix"), cxxopts::value<std::string>()->default_value("native"))
            ("i,index", get_string("help.index"), cxxopts::value<std::vector<std::string>>())
            ("single", get_string("help.single"), cxxopts::value<bool>()->default_value("false"))
            ("fuzzy", get_string("help.fuzzy"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("packages", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "packages"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result["verbose"].as<bool>()) {
            set_log_level(LogLevel::VERBOSE);
        } else if (result["debug"].as<bool>()) {
            set_log_level(LogLevel::DEBUG);
        }

        if (result.count("config-dir")) {
            set_config_dir(result["config-dir"].as<std::string>());
        }
        if (result.count("work")) {
            set_work_dir(result["work"].as<std::string>());
        }
        if (result.count("aports")) {
            set_aports_dir(result["aports"].as<std::string>());
        }
        if (result.count("channel")) {
            set_channel(result["channel"].as<std::string>());
        }
        if (result.count("arch")) {
            set_architecture(result["arch"].as<std::string>());
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        const std::vector<std::string> args =
            result.count("packages") ? result["packages"].as<std::vector<std::string>>() : std::vector<std::string>{};
        const std::string suffix = result["suffix"].as<std::string>();
        auto usage_printer = [&]() { print_usage(options); };

        // Explicit index files replace the configured repositories
        auto index_files = [&](const std::string& arch) {
            if (!result.count("index")) return apkindex_files(arch);
            std::vector<fs::path> paths;
            for (const auto& path : result["index"].as<std::vector<std::string>>()) paths.emplace_back(path);
            return paths;
        };

        IndexCache cache;

        if (command == "compare") {
            pre_operation_check(args, usage_printer, 2, 2);
            const int ret = version_compare(args[0], args[1], result["fuzzy"].as<bool>());
            std::cout << (ret < 0 ? "<" : ret > 0 ? ">" : "=") << std::endl;
        } else if (command == "validate") {
            pre_operation_check(args, usage_printer, 1);
            bool all_valid = true;
            for (const auto& version : args) {
                const bool valid = version_validate(version);
                all_valid = all_valid && valid;
                std::cout << version << ": " << get_string(valid ? "info.valid" : "info.invalid") << std::endl;
            }
            return all_valid ? 0 : 1;
        } else if (command == "check") {
            pre_operation_check(args, usage_printer, 2, 2);
            const bool matches = version_check_string(args[0], args[1]);
            std::cout << (matches ? "true" : "false") << std::endl;
            return matches ? 0 : 1;
        } else if (command == "index") {
            pre_operation_check(args, usage_printer, 1, 1);
            print_index(*cache.parse(args[0], !result["single"].as<bool>()));
        } else if (command == "blocks") {
            pre_operation_check(args, usage_printer, 1, 1);
            for (const auto& record : parse_blocks(args[0])) {
                print_record(record);
            }
        } else if (command == "providers") {
            pre_operation_check(args, usage_printer, 1, 1);
            const auto found = providers(args[0], index_files(arch_from_suffix(suffix)), cache);
            for (const auto& [pkgname, record] : found) {
                std::cout << format_record(*record) << std::endl;
            }
        } else if (command == "package") {
            pre_operation_check(args, usage_printer, 1, 1);
            print_record(*package(args[0], index_files(arch_from_suffix(suffix)), cache));
        } else if (command == "depends") {
            pre_operation_check(args, usage_printer, 1);
            RecipeTree recipes(APORTS_DIR);
            DependencyResolver resolver(cache, index_files(arch_from_suffix(suffix)), installed_db_path(suffix),
                                        &recipes, get_selected_providers());
            for (const auto& pkgname : resolver.recurse(args)) {
                std::cout << pkgname << std::endl;
            }
        } else if (command == "find-recipe") {
            pre_operation_check(args, usage_printer, 1, 1);
            RecipeTree recipes(APORTS_DIR);
            auto dir = recipes.find_recipe(args[0]);
            if (!dir) {
                throw PackageNotFoundError(string_format("error.recipe_not_found", args[0]));
            }
            const Recipe& recipe = recipes.get(*dir);
            std::cout << dir->string() << std::endl;
            std::cout << recipe.pkgname << "-" << recipe.version() << std::endl;
        } else {
            usage_printer();
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const ApkmetaException& e) {
        log_error(string_format("error.apkmeta_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
