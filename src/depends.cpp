#include "depends.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "providers.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>
#include <deque>
#include <set>

DependencyResolver::DependencyResolver(IndexCache& cache, std::vector<fs::path> indexes, fs::path installed_db,
                                       RecipeTree* recipes, std::map<std::string, std::string> selected_providers)
    : cache_(cache), indexes_(std::move(indexes)), installed_db_(std::move(installed_db)), recipes_(recipes),
      selected_providers_(std::move(selected_providers)) {}

std::unordered_set<std::string> DependencyResolver::installed() {
    std::unordered_set<std::string> ret;
    const auto view = cache_.parse(installed_db_, false);
    for (const auto& [name, providers] : view->entries) {
        ret.insert(name);
    }
    return ret;
}

PackageRecordPtr DependencyResolver::package_from_recipes(const std::string& name) {
    if (!recipes_) return nullptr;

    auto recipe_dir = recipes_->find_recipe(name);
    if (!recipe_dir) return nullptr;

    const Recipe& recipe = recipes_->get(*recipe_dir);
    auto candidate = std::make_shared<PackageRecord>();
    candidate->pkgname = recipe.pkgname;
    candidate->version = recipe.version();
    candidate->arch = join(recipe.arch, " ");
    for (const auto& depend : recipe.depends) {
        candidate->depends.push_back(remove_operators(depend));
    }
    for (const auto& provide : recipe.provides) {
        candidate->provides.push_back(remove_operators(provide));
    }

    log_verbose(string_format("verbose.provided_by_recipe", name, candidate->pkgname, candidate->version,
                              recipe_dir->string()));
    return candidate;
}

PackageRecordPtr DependencyResolver::package_provider(const std::string& name, const std::vector<std::string>& to_install) {
    const ProviderMap found = providers(name, indexes_, cache_, false);
    if (found.empty()) return nullptr;

    // The sets are only needed when there is a real choice to make
    std::unordered_set<std::string> to_install_set;
    std::unordered_set<std::string> installed_set;
    if (found.size() > 1 && !found.contains(name)) {
        to_install_set.insert(to_install.begin(), to_install.end());
        installed_set = installed();
    }
    return select_provider(name, found, to_install_set, installed_set, selected_providers_);
}

PackageRecordPtr DependencyResolver::package_from_index(const std::string& name, const std::vector<std::string>& to_install,
                                                        const PackageRecordPtr& recipe_package) {
    auto provider = package_provider(name, to_install);
    if (!provider) {
        return recipe_package;
    }

    if (recipe_package && version_compare(recipe_package->version, provider->version) == 1) {
        log_verbose(string_format("verbose.binary_outdated", name));
        return recipe_package;
    }

    // Up to date binary packages have sonames in their depends, prefer them
    if (recipe_package) {
        log_verbose(string_format("verbose.binary_up_to_date", name));
    }
    return provider;
}

std::vector<std::string> DependencyResolver::recurse(const std::vector<std::string>& pkgnames) {
    log_debug(string_format("debug.calculate_depends", join(pkgnames, ", ")));

    std::deque<std::string> todo(pkgnames.begin(), pkgnames.end());
    std::map<std::string, std::set<std::string>> required_by;
    std::vector<std::string> ret;
    std::unordered_set<std::string> seen;

    while (!todo.empty()) {
        std::string entry = std::move(todo.front());
        todo.pop_front();
        if (seen.contains(entry)) continue;

        const bool is_conflict = entry.starts_with('!');
        const std::string name = entry.substr(std::min(entry.find_first_not_of('!'), entry.size()));

        std::vector<std::string> to_install(ret);
        to_install.insert(to_install.end(), todo.begin(), todo.end());

        const PackageRecordPtr package = package_from_index(name, to_install, package_from_recipes(name));

        if (!package) {
            // Most likely dropped from the repositories, which is fine for a
            // package that must not be installed anyway
            if (is_conflict) continue;

            std::string source = "world";
            if (auto it = required_by.find(name); it != required_by.end()) {
                source = join(std::vector<std::string>(it->second.begin(), it->second.end()), ", ");
            }
            throw DependencyNotFoundError(string_format("error.dependency_not_found", name, source));
        }

        const std::string pkgname = is_conflict ? "!" + package->pkgname : package->pkgname;
        if (seen.contains(pkgname)) {
            log_verbose(string_format("verbose.already_found", pkgname));
            continue;
        }

        if (!is_conflict) {
            log_verbose(string_format("verbose.depends_on", pkgname, join(package->depends, ",")));
            for (const auto& depend : package->depends) {
                todo.push_back(depend);
                required_by[depend].insert(name);
            }
        }
        ret.push_back(pkgname);
        seen.insert(pkgname);
    }
    return ret;
}

DependencyResolver make_resolver(IndexCache& cache, RecipeTree* recipes, const std::string& suffix) {
    return DependencyResolver(cache, apkindex_files(arch_from_suffix(suffix)), installed_db_path(suffix), recipes,
                              get_selected_providers());
}
