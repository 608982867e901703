#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <unordered_map>
#include <filesystem>

struct Subpackage {
    std::string name;
    // False when the package function could not be found (e.g. default
    // functions like -doc); depends and provides are empty then.
    bool has_function = false;
    std::vector<std::string> depends;
    std::vector<std::string> provides;
};

// The parts of an APKBUILD that dependency resolution needs.
struct Recipe {
    std::filesystem::path path;
    std::string pkgname;
    std::string pkgver;
    std::string pkgrel;
    std::vector<std::string> arch;
    std::vector<std::string> depends;
    std::vector<std::string> provides; // as written, e.g. "mkbootimg=0.0.1"
    std::vector<Subpackage> subpackages;

    std::string version() const { return pkgver + "-r" + pkgrel; }
    const Subpackage* find_subpackage(const std::string& name) const;
};

// Parse an APKBUILD without running a shell. Handles single and multi-line
// assignments, quotes, trailing comments and the common variable expansions.
// Throws RecipeParseError on unterminated quotes, wrong line endings, a
// pkgname that differs from the folder name or an invalid pkgver.
Recipe parse_recipe(const std::filesystem::path& apkbuild);

// Local recipe tree ("aports"): <root>/<any>/<pkgname>/APKBUILD
class RecipeTree {
public:
    explicit RecipeTree(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    // All pkgnames that have their own folder, sorted
    std::vector<std::string> list();

    // Folder of the recipe that builds `name`, which may also be a
    // subpackage or a versioned provides entry of that recipe.
    std::optional<std::filesystem::path> find_recipe(const std::string& name);

    // Parsed APKBUILD of a recipe folder (cached)
    const Recipe& get(const std::filesystem::path& recipe_dir);

private:
    const std::map<std::string, std::filesystem::path>& apkbuilds();
    std::optional<std::filesystem::path> guess_main(const std::string& subpkgname);
    bool recipe_provides(const std::string& name, const std::filesystem::path& recipe_dir);

    std::filesystem::path root_;
    std::optional<std::map<std::string, std::filesystem::path>> apkbuilds_;
    std::unordered_map<std::string, std::optional<std::filesystem::path>> find_cache_;
    std::unordered_map<std::string, Recipe> recipe_cache_;
};
