#include <gtest/gtest.h>
#include "aports.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

const char* FOO_APKBUILD = R"(# Maintainer: Jane Doe <jane@example.org>
pkgname=foo
pkgver=1.2.3
pkgrel=2
pkgdesc="Test package" # trailing comment
arch="x86_64 aarch64"
depends="bar
	baz>=1.0
	"
makedepends="$depends_dev gcc"
provides="foo-virtual=$pkgver libfoo"
subpackages="$pkgname-dev $pkgname-tools:tools_pkg:noarch ${pkgname}-doc"
_flavor="${pkgname/foo/qux}"
_short="${pkgver#1.}"
source="https://example.org/$pkgname-$pkgver.tar.gz"

build() {
	make
}

tools_pkg() {
	depends="$pkgname=$pkgver-r$pkgrel python3"
	provides="foo-tool=$pkgver $_flavor-$_short"
	mkdir -p "$subpkgdir"
}
)";

const char* HELLO_APKBUILD = R"(pkgname=hello-world
pkgver=1
pkgrel=4
arch="all"
subpackages="foo-extra:extra"

extra() {
	depends="hello-world"
}
)";

} // anonymous namespace

class AportsTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path aports;

    void SetUp() override {
        test_dir = fs::absolute("tmp_aports_test");
        fs::remove_all(test_dir);
        aports = test_dir / "aports";
        fs::create_directories(aports);
        init_localization();

        write_apkbuild("main/foo", FOO_APKBUILD);
        write_apkbuild("main/hello-world", HELLO_APKBUILD);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_apkbuild(const std::string& dir, const std::string& content) {
        fs::create_directories(aports / dir);
        fs::path path = aports / dir / "APKBUILD";
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(AportsTest, ParseRecipe) {
    Recipe recipe = parse_recipe(aports / "main/foo/APKBUILD");
    EXPECT_EQ(recipe.pkgname, "foo");
    EXPECT_EQ(recipe.pkgver, "1.2.3");
    EXPECT_EQ(recipe.pkgrel, "2");
    EXPECT_EQ(recipe.version(), "1.2.3-r2");
    EXPECT_EQ(recipe.arch, (std::vector<std::string>{"x86_64", "aarch64"}));
    EXPECT_EQ(recipe.depends, (std::vector<std::string>{"bar", "baz>=1.0"}));
    EXPECT_EQ(recipe.provides, (std::vector<std::string>{"foo-virtual=1.2.3", "libfoo"}));

    ASSERT_EQ(recipe.subpackages.size(), 3u);
    EXPECT_EQ(recipe.subpackages[0].name, "foo-dev");
    EXPECT_FALSE(recipe.subpackages[0].has_function);
    EXPECT_EQ(recipe.subpackages[2].name, "foo-doc");

    const Subpackage* tools = recipe.find_subpackage("foo-tools");
    ASSERT_NE(tools, nullptr);
    EXPECT_TRUE(tools->has_function);
    EXPECT_EQ(tools->depends, (std::vector<std::string>{"foo=1.2.3-r2", "python3"}));
    EXPECT_EQ(tools->provides, (std::vector<std::string>{"foo-tool=1.2.3", "qux-2.3"}));
    EXPECT_EQ(recipe.find_subpackage("foo-missing"), nullptr);
}

TEST_F(AportsTest, DefaultPkgrel) {
    auto path = write_apkbuild("main/norel", "pkgname=norel\npkgver=1.0\n");
    EXPECT_EQ(parse_recipe(path).version(), "1.0-r0");
}

TEST_F(AportsTest, ParseErrors) {
    auto quote = write_apkbuild("main/quote", "pkgname=quote\npkgver=1.0\ndepends=\"a\n\tb\n");
    EXPECT_THROW(parse_recipe(quote), RecipeParseError);

    auto crlf = write_apkbuild("main/crlf", "pkgname=crlf\r\npkgver=1.0\r\n");
    EXPECT_THROW(parse_recipe(crlf), RecipeParseError);

    auto folder = write_apkbuild("main/folder", "pkgname=other\npkgver=1.0\n");
    EXPECT_THROW(parse_recipe(folder), RecipeParseError);

    auto pkgver = write_apkbuild("main/pkgver", "pkgname=pkgver\npkgver=1.0-beta\n");
    EXPECT_THROW(parse_recipe(pkgver), RecipeParseError);

    auto noend = write_apkbuild("main/noend", "pkgname=noend\npkgver=1.0\nsubpackages=\"$pkgname-x:x\"\nx() {\n\tdepends=\"a\"\n");
    EXPECT_THROW(parse_recipe(noend), RecipeParseError);
}

TEST_F(AportsTest, ListSkipsHiddenAndTopLevel) {
    write_apkbuild(".git/foo", "pkgname=foo\npkgver=1.0\n");
    std::ofstream(aports / "APKBUILD") << "pkgname=aports\npkgver=1.0\n";

    RecipeTree tree(aports);
    EXPECT_EQ(tree.list(), (std::vector<std::string>{"foo", "hello-world"}));
}

TEST_F(AportsTest, DuplicateFolders) {
    write_apkbuild("testing/foo", FOO_APKBUILD);
    RecipeTree tree(aports);
    EXPECT_THROW(tree.list(), ApkmetaException);
}

TEST_F(AportsTest, MissingTree) {
    RecipeTree tree(test_dir / "nonexistent");
    EXPECT_TRUE(tree.list().empty());
    EXPECT_FALSE(tree.find_recipe("foo").has_value());
}

TEST_F(AportsTest, FindRecipe) {
    RecipeTree tree(aports);
    const fs::path foo = aports / "main/foo";
    const fs::path hello = aports / "main/hello-world";

    EXPECT_EQ(tree.find_recipe("foo"), foo);
    EXPECT_EQ(tree.find_recipe("hello-world"), hello);
    // Subpackages, with and without a package function
    EXPECT_EQ(tree.find_recipe("foo-tools"), foo);
    EXPECT_EQ(tree.find_recipe("foo-dev"), foo);
    // Versioned provides of the main package and of a subpackage
    EXPECT_EQ(tree.find_recipe("foo-virtual"), foo);
    EXPECT_EQ(tree.find_recipe("foo-tool"), foo);
    // Wrong guess, found by scanning all recipes
    EXPECT_EQ(tree.find_recipe("foo-extra"), hello);
    // Nothing provides it, the guess is used
    EXPECT_EQ(tree.find_recipe("foo-unknown"), foo);

    EXPECT_FALSE(tree.find_recipe("bar-dev").has_value());
    EXPECT_FALSE(tree.find_recipe("libfoo").has_value());
    EXPECT_FALSE(tree.find_recipe("missing").has_value());
}

TEST_F(AportsTest, FindRecipeInvalidName) {
    RecipeTree tree(aports);
    EXPECT_THROW(tree.find_recipe("foo*"), ApkmetaException);
}

TEST_F(AportsTest, GetIsCached) {
    RecipeTree tree(aports);
    const Recipe& first = tree.get(aports / "main/foo");
    const Recipe& second = tree.get(aports / "main/foo");
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.pkgname, "foo");
}
