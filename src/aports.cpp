#include "aports.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <regex>

namespace {

using Variables = std::map<std::string, std::string>;

const std::regex re_assignment(R"(^([A-Za-z_][A-Za-z0-9_]*)=(.*)$)");

// ${foo}
const std::regex re_var_braces(R"(\$\{([a-zA-Z_]+[a-zA-Z0-9_]*)\})");
// $foo
const std::regex re_var(R"(\$([a-zA-Z_]+[a-zA-Z0-9_]*))");
// ${var/foo/bar}, ${var/foo/}, ${var/foo}
const std::regex re_var_replace(R"(\$\{([a-zA-Z_]+[a-zA-Z0-9_]*)/([^/]+)(?:/([^/]*?))?\})");
// ${foo#bar}
const std::regex re_var_cut_prefix(R"(\$\{([a-zA-Z_]+[a-zA-Z0-9_]*)#(.*)\})");

void replace_first(std::string& value, const std::string& search, const std::string& replacement) {
    if (auto pos = value.find(search); pos != std::string::npos) {
        value.replace(pos, search.size(), replacement);
    }
}

// Apply `expand` to every match of `re` in the current value
template<typename Expand>
void replace_matches(std::string& value, const std::regex& re, const Variables& vars, Expand expand) {
    std::vector<std::smatch> matches;
    const std::string snapshot = value;
    for (auto it = std::sregex_iterator(snapshot.begin(), snapshot.end(), re); it != std::sregex_iterator(); ++it) {
        matches.push_back(*it);
    }
    for (const auto& match : matches) {
        auto var = vars.find(match[1].str());
        if (var == vars.end()) {
            log_verbose(string_format("verbose.recipe_var_not_found", match[1].str(), match[0].str()));
            continue;
        }
        replace_first(value, match[0].str(), expand(var->second, match));
    }
}

std::string replace_variables(std::string value, const Variables& vars) {
    replace_matches(value, re_var_braces, vars, [](const std::string& v, const std::smatch&) { return v; });
    replace_matches(value, re_var, vars, [](const std::string& v, const std::smatch&) { return v; });
    replace_matches(value, re_var_replace, vars, [](std::string v, const std::smatch& m) {
        replace_first(v, m[2].str(), m[3].matched ? m[3].str() : "");
        return v;
    });
    replace_matches(value, re_var_cut_prefix, vars, [](std::string v, const std::smatch& m) {
        if (v.starts_with(m[2].str())) v.erase(0, m[2].length());
        return v;
    });
    return value;
}

// Parse the assignment in lines[i], which may continue on the next lines.
// Advances i to the last line of the assignment.
std::optional<std::pair<std::string, std::string>> parse_assignment(const std::vector<std::string>& lines, size_t& i,
                                                                    const fs::path& path) {
    std::smatch match;
    if (!std::regex_match(lines[i], match, re_assignment)) {
        return std::nullopt;
    }
    const std::string name = match[1].str();
    std::string value = match[2].str();

    char end_char = 0;
    if (!value.empty() && (value[0] == '"' || value[0] == '\'')) {
        end_char = value[0];
        value.erase(0, 1);
    }

    if (!end_char) {
        value = trim(value.substr(0, value.find('#')));
        return std::make_pair(name, value);
    }
    if (auto pos = value.find(end_char); pos != std::string::npos) {
        return std::make_pair(name, value.substr(0, pos));
    }

    for (++i; i < lines.size(); ++i) {
        value += " ";
        if (auto pos = lines[i].find(end_char); pos != std::string::npos) {
            value += trim(lines[i].substr(0, pos));
            return std::make_pair(name, trim(value));
        }
        value += trim(lines[i]);
    }
    throw RecipeParseError(string_format("error.recipe_missing_quote", std::string(1, end_char), name, path.string()));
}

void parse_assignments(const std::vector<std::string>& lines, Variables& vars, const fs::path& path) {
    for (size_t i = 0; i < lines.size(); ++i) {
        if (auto assignment = parse_assignment(lines, i, path)) {
            vars[assignment->first] = replace_variables(assignment->second, vars);
        }
    }
}

std::string get_var(const Variables& vars, const std::string& name) {
    auto it = vars.find(name);
    return it == vars.end() ? "" : it->second;
}

Subpackage parse_subpackage(const std::vector<std::string>& lines, const Variables& vars, const std::string& entry,
                            const fs::path& path) {
    // "$pkgname-foo:custom_function:noarch"
    const auto parts = split(entry, ':', false);
    Subpackage subpkg;
    subpkg.name = parts[0];

    std::string function = subpkg.name.substr(subpkg.name.rfind('-') + 1);
    if (parts.size() > 1 && !parts[1].empty()) {
        function = parts[1];
    }

    const std::string prefix = function + "() {";
    size_t start = 0, end = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].starts_with(prefix)) {
            start = i + 1;
        } else if (start && lines[i].starts_with("}")) {
            end = i;
            break;
        }
    }

    if (!start) {
        log_verbose(string_format("verbose.recipe_no_subpkg_function", get_var(vars, "pkgname"), function, subpkg.name));
        return subpkg;
    }
    if (!end) {
        throw RecipeParseError(string_format("error.recipe_subpkg_no_end", prefix, path.string()));
    }

    std::vector<std::string> body;
    for (size_t i = start; i < end; ++i) body.push_back(trim(lines[i]));

    Variables sub_vars = vars;
    sub_vars["subpkgname"] = subpkg.name;
    parse_assignments(body, sub_vars, path);

    subpkg.has_function = true;
    subpkg.depends = split(get_var(sub_vars, "depends"), ' ');
    subpkg.provides = split(get_var(sub_vars, "provides"), ' ');
    return subpkg;
}

std::vector<std::string> read_recipe_lines(const fs::path& path) {
    const std::string content = read_file(path);
    if (content.find('\r') != std::string::npos) {
        throw RecipeParseError(string_format("error.recipe_line_endings", path.string()));
    }
    std::vector<std::string> lines = split(content, '\n', false);
    if (!lines.empty() && lines.back().empty()) lines.pop_back();
    return lines;
}

} // anonymous namespace

const Subpackage* Recipe::find_subpackage(const std::string& name) const {
    for (const auto& subpkg : subpackages) {
        if (subpkg.name == name) return &subpkg;
    }
    return nullptr;
}

Recipe parse_recipe(const fs::path& apkbuild) {
    const auto lines = read_recipe_lines(apkbuild);

    Variables vars;
    parse_assignments(lines, vars, apkbuild);

    Recipe recipe;
    recipe.path = apkbuild;
    recipe.pkgname = get_var(vars, "pkgname");
    recipe.pkgver = get_var(vars, "pkgver");
    recipe.pkgrel = get_var(vars, "pkgrel");
    if (recipe.pkgrel.empty()) recipe.pkgrel = "0";
    recipe.arch = split(get_var(vars, "arch"), ' ');
    recipe.depends = split(get_var(vars, "depends"), ' ');
    recipe.provides = split(get_var(vars, "provides"), ' ');

    for (const auto& entry : split(get_var(vars, "subpackages"), ' ')) {
        recipe.subpackages.push_back(parse_subpackage(lines, vars, entry, apkbuild));
    }

    const std::string folder = fs::weakly_canonical(apkbuild).parent_path().filename().string();
    if (recipe.pkgname != folder) {
        throw RecipeParseError(string_format("error.recipe_pkgname_folder", recipe.pkgname, folder, apkbuild.string()));
    }
    if (!version_validate(recipe.pkgver)) {
        throw RecipeParseError(string_format("error.recipe_invalid_pkgver", recipe.pkgver, apkbuild.string()));
    }
    return recipe;
}

RecipeTree::RecipeTree(fs::path root) : root_(std::move(root)) {}

const std::map<std::string, fs::path>& RecipeTree::apkbuilds() {
    if (apkbuilds_) return *apkbuilds_;

    std::map<std::string, fs::path> found;
    if (!fs::is_directory(root_)) {
        log_verbose(string_format("verbose.aports_not_found", root_.string()));
        apkbuilds_ = std::move(found);
        return *apkbuilds_;
    }

    for (auto it = fs::recursive_directory_iterator(root_); it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        if (entry.is_directory() && entry.path().filename().string().starts_with(".")) {
            it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file() || entry.path().filename() != "APKBUILD" || it.depth() == 0) {
            continue;
        }
        const fs::path dir = entry.path().parent_path();
        const std::string package = dir.filename().string();
        if (found.contains(package)) {
            throw RecipeParseError(string_format("error.recipe_multiple_folders", package));
        }
        found.emplace(package, dir);
    }
    apkbuilds_ = std::move(found);
    return *apkbuilds_;
}

std::vector<std::string> RecipeTree::list() {
    std::vector<std::string> ret;
    for (const auto& [name, dir] : apkbuilds()) ret.push_back(name);
    return ret;
}

const Recipe& RecipeTree::get(const fs::path& recipe_dir) {
    const std::string key = recipe_dir.string();
    auto it = recipe_cache_.find(key);
    if (it == recipe_cache_.end()) {
        it = recipe_cache_.emplace(key, parse_recipe(recipe_dir / "APKBUILD")).first;
    }
    return it->second;
}

std::optional<fs::path> RecipeTree::guess_main(const std::string& subpkgname) {
    const auto& all = apkbuilds();

    // "foo-dev" belongs to "foo" or to something that is not in this tree.
    // Cutting further would pick e.g. "plasma" for "plasma-framework-dev".
    if (subpkgname.ends_with("-dev")) {
        const std::string pkgname = subpkgname.substr(0, subpkgname.size() - 4);
        if (auto it = all.find(pkgname); it != all.end()) {
            log_verbose(string_format("verbose.guess_main_dev", subpkgname, pkgname));
            return it->second;
        }
        log_verbose(string_format("verbose.guess_main_dev_missing", subpkgname, pkgname));
        return std::nullopt;
    }

    auto words = split(subpkgname, '-', false);
    while (words.size() > 1) {
        words.pop_back();
        const std::string pkgname = join(words, "-");
        if (auto it = all.find(pkgname); it != all.end()) {
            log_verbose(string_format("verbose.guess_main", subpkgname, pkgname));
            return it->second;
        }
    }
    return std::nullopt;
}

bool RecipeTree::recipe_provides(const std::string& name, const fs::path& recipe_dir) {
    const Recipe& recipe = get(recipe_dir);
    if (recipe.find_subpackage(name)) return true;

    // Provides without a version are never selected automatically
    auto provides_name = [&name](const std::vector<std::string>& provides) {
        for (const auto& entry : provides) {
            const auto pos = entry.find('=');
            if (pos != std::string::npos && entry.substr(0, pos) == name) return true;
        }
        return false;
    };

    if (provides_name(recipe.provides)) return true;
    for (const auto& subpkg : recipe.subpackages) {
        if (subpkg.has_function && provides_name(subpkg.provides)) return true;
    }
    return false;
}

std::optional<fs::path> RecipeTree::find_recipe(const std::string& name) {
    if (auto it = find_cache_.find(name); it != find_cache_.end()) {
        return it->second;
    }
    if (name.find('*') != std::string::npos) {
        throw ApkmetaException(string_format("error.invalid_pkgname", name));
    }

    std::optional<fs::path> ret;
    const auto& all = apkbuilds();
    if (auto it = all.find(name); it != all.end()) {
        ret = it->second;
    } else if (auto guess = guess_main(name)) {
        if (recipe_provides(name, *guess)) {
            ret = guess;
        } else {
            // Slow path: parse every APKBUILD in the tree
            for (const auto& [pkgname, dir] : all) {
                if (recipe_provides(name, dir)) {
                    ret = dir;
                    break;
                }
            }
        }
        // The subpackage may be defined behind shell logic we do not parse
        if (!ret) ret = guess;
    }

    find_cache_[name] = ret;
    return ret;
}
