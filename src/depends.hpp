#pragma once

#include "apkindex.hpp"
#include "aports.hpp"
#include "index_cache.hpp"

#include <string>
#include <vector>
#include <map>
#include <unordered_set>
#include <filesystem>

// Resolves dependencies for one target environment (chroot), looking at the
// local recipe tree first and the binary package indexes second.
class DependencyResolver {
public:
    // `recipes` may be nullptr to only use binary packages
    DependencyResolver(IndexCache& cache, std::vector<std::filesystem::path> indexes,
                       std::filesystem::path installed_db, RecipeTree* recipes,
                       std::map<std::string, std::string> selected_providers = {});

    // All given pkgnames plus their dependencies, in the order they were
    // found (breadth first). Conflicting dependencies are prefixed with "!".
    // Throws DependencyNotFoundError if a dependency can't be found anywhere.
    std::vector<std::string> recurse(const std::vector<std::string>& pkgnames);

    // Candidate from the recipe tree: pkgname, version (pkgver-rpkgrel) and
    // depends of the recipe. nullptr if there is none.
    PackageRecordPtr package_from_recipes(const std::string& name);

    // One binary provider of `name`, see select_provider()
    PackageRecordPtr package_provider(const std::string& name, const std::vector<std::string>& to_install);

    // Binary provider, unless the recipe has a newer version
    PackageRecordPtr package_from_index(const std::string& name, const std::vector<std::string>& to_install,
                                        const PackageRecordPtr& recipe_package);

    // Names (pkgnames and provides) installed in the target environment
    std::unordered_set<std::string> installed();

private:
    IndexCache& cache_;
    std::vector<std::filesystem::path> indexes_;
    std::filesystem::path installed_db_;
    RecipeTree* recipes_;
    std::map<std::string, std::string> selected_providers_;
};

// Resolver for a chroot suffix ("native", "buildroot_armhf", ...) using the
// configured work dir, repositories and provider selection.
DependencyResolver make_resolver(IndexCache& cache, RecipeTree* recipes, const std::string& suffix = "native");
