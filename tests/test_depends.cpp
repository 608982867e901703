#include <gtest/gtest.h>
#include "depends.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class DependsTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path index_path;
    fs::path installed_path;
    IndexCache cache;

    void SetUp() override {
        test_dir = fs::absolute("tmp_depends_test");
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        index_path = test_dir / "APKINDEX";
        installed_path = test_dir / "installed";
        init_localization();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    // Each entry is "pkgname version depends [provides]"
    static std::string block(const std::string& pkgname, const std::string& version,
                             const std::string& depends = "", const std::string& provides = "") {
        std::string ret = "P:" + pkgname + "\nV:" + version + "\nA:x86_64\nt:1600000000\n";
        if (!depends.empty()) ret += "D:" + depends + "\n";
        if (!provides.empty()) ret += "p:" + provides + "\n";
        return ret + "\n";
    }

    void write(const fs::path& path, const std::string& content) {
        std::ofstream(path) << content;
        cache.clear_all();
    }

    void write_apkbuild(const std::string& pkgname, const std::string& content) {
        fs::create_directories(test_dir / "aports/main" / pkgname);
        std::ofstream(test_dir / "aports/main" / pkgname / "APKBUILD") << content;
    }

    DependencyResolver resolver(RecipeTree* recipes = nullptr) {
        return DependencyResolver(cache, {index_path}, installed_path, recipes);
    }
};

TEST_F(DependsTest, BreadthFirstOrder) {
    write(index_path, block("a", "1-r0", "b c") + block("b", "1-r0", "d") + block("c", "1-r0", "e") +
                      block("d", "1-r0") + block("e", "1-r0"));
    EXPECT_EQ(resolver().recurse({"a"}), (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST_F(DependsTest, CircularDependencies) {
    write(index_path, block("a", "1-r0", "b") + block("b", "1-r0", "a"));
    EXPECT_EQ(resolver().recurse({"a"}), (std::vector<std::string>{"a", "b"}));
}

TEST_F(DependsTest, DuplicatesAndOperators) {
    write(index_path, block("a", "1-r0", "b>=1.0 b<2") + block("b", "1.5-r0"));
    EXPECT_EQ(resolver().recurse({"a", "a", "b"}), (std::vector<std::string>{"a", "b"}));
}

TEST_F(DependsTest, ProvidedNameResolvesToPkgname) {
    write(index_path, block("a", "1-r0", "cmd:hello so:libb.so.1") + block("hello", "1-r0", "", "cmd:hello") +
                      block("libb", "1-r0", "", "so:libb.so.1=1.0"));
    EXPECT_EQ(resolver().recurse({"a"}), (std::vector<std::string>{"a", "hello", "libb"}));
}

TEST_F(DependsTest, MissingConflictIsIgnored) {
    write(index_path, block("a", "1-r0"));
    EXPECT_TRUE(resolver().recurse({"!nonexistent-pkg"}).empty());
}

TEST_F(DependsTest, ConflictIsNotExpanded) {
    write(index_path, block("a", "1-r0", "!b") + block("b", "1-r0", "c") + block("c", "1-r0"));
    EXPECT_EQ(resolver().recurse({"a"}), (std::vector<std::string>{"a", "!b"}));
}

TEST_F(DependsTest, MissingDependencyNamesRequester) {
    write(index_path, block("requester-pkg", "1-r0", "missing-dep"));
    try {
        resolver().recurse({"requester-pkg"});
        FAIL() << "Expected DependencyNotFoundError";
    } catch (const DependencyNotFoundError& e) {
        EXPECT_NE(std::string(e.what()).find("missing-dep"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("requester-pkg"), std::string::npos);
    }

    try {
        resolver().recurse({"missing-world"});
        FAIL() << "Expected DependencyNotFoundError";
    } catch (const DependencyNotFoundError& e) {
        EXPECT_NE(std::string(e.what()).find("world"), std::string::npos);
    }
}

TEST_F(DependsTest, InstalledProviderIsPreferred) {
    write(index_path, block("a", "1-r0", "so:libEGL.so.1") + block("mesa-egl", "1-r0", "", "so:libEGL.so.1") +
                      block("libhybris", "1-r0", "", "so:libEGL.so.1"));
    write(installed_path, block("libhybris", "1-r0", "", "so:libEGL.so.1"));

    auto r = resolver();
    EXPECT_TRUE(r.installed().contains("libhybris"));
    EXPECT_TRUE(r.installed().contains("so:libEGL.so.1"));
    EXPECT_EQ(r.recurse({"a"}), (std::vector<std::string>{"a", "libhybris"}));
}

TEST_F(DependsTest, PendingProviderIsPreferred) {
    write(index_path, block("a", "1-r0", "so:libEGL.so.1 mesa-egl") + block("mesa-egl", "1-r0", "", "so:libEGL.so.1") +
                      block("libhybris", "1-r0", "", "so:libEGL.so.1"));
    write(installed_path, block("libhybris", "1-r0", "", "so:libEGL.so.1"));
    EXPECT_EQ(resolver().recurse({"a"}), (std::vector<std::string>{"a", "mesa-egl"}));
}

TEST_F(DependsTest, SelectedProvider) {
    write(index_path, block("a", "1-r0", "so:libEGL.so.1") + block("mesa-egl", "1-r0", "", "so:libEGL.so.1") +
                      block("libhybris", "1-r0", "", "so:libEGL.so.1"));
    DependencyResolver r(cache, {index_path}, installed_path, nullptr, {{"so:libEGL.so.1", "libhybris"}});
    EXPECT_EQ(r.recurse({"a"}), (std::vector<std::string>{"a", "libhybris"}));
}

TEST_F(DependsTest, NewerRecipeWinsOverBinary) {
    write_apkbuild("app", "pkgname=app\npkgver=2.0\npkgrel=0\ndepends=\"libnew>=1\"\n");
    write(index_path, block("app", "1.0-r0", "libold") + block("libold", "1-r0") + block("libnew", "1-r0"));
    RecipeTree recipes(test_dir / "aports");

    auto r = resolver(&recipes);
    auto recipe_package = r.package_from_recipes("app");
    ASSERT_NE(recipe_package, nullptr);
    EXPECT_EQ(recipe_package->version, "2.0-r0");
    EXPECT_EQ(recipe_package->depends, (std::vector<std::string>{"libnew"}));
    EXPECT_EQ(r.recurse({"app"}), (std::vector<std::string>{"app", "libnew"}));
}

TEST_F(DependsTest, UpToDateBinaryWinsOverRecipe) {
    write_apkbuild("app", "pkgname=app\npkgver=2.0\npkgrel=0\ndepends=\"libnew\"\n");
    write(index_path, block("app", "2.0-r0", "libold") + block("libold", "1-r0") + block("libnew", "1-r0"));
    RecipeTree recipes(test_dir / "aports");
    EXPECT_EQ(resolver(&recipes).recurse({"app"}), (std::vector<std::string>{"app", "libold"}));
}

TEST_F(DependsTest, RecipeOnlyPackage) {
    write_apkbuild("app", "pkgname=app\npkgver=2.0\npkgrel=0\ndepends=\"libnew\"\n");
    write(index_path, block("libnew", "1-r0"));
    RecipeTree recipes(test_dir / "aports");
    EXPECT_EQ(resolver(&recipes).recurse({"app"}), (std::vector<std::string>{"app", "libnew"}));
}

TEST_F(DependsTest, MissingIndexesAndDatabase) {
    DependencyResolver r(cache, {test_dir / "nonexistent"}, test_dir / "nonexistent-db", nullptr);
    EXPECT_TRUE(r.installed().empty());
    EXPECT_EQ(r.package_provider("anything", {}), nullptr);
    EXPECT_THROW(r.recurse({"anything"}), DependencyNotFoundError);
}
