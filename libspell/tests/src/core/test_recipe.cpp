// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <variant>

#include <catch2/catch_all.hpp>

#include "spell/core/error_handling.hpp"
#include "spell/core/recipe.hpp"

#include "spelltests.hpp"

using namespace spell;

namespace
{
    auto parse(std::string_view doc, const variable_map& env = {}) -> Recipe
    {
        return Recipe::parse(doc, "/recipes/test.yml", env);
    }

    auto parse_error_code(std::string_view doc) -> spell_error_code
    {
        try
        {
            [[maybe_unused]] const auto r = parse(doc);
        }
        catch (const spell_error& ex)
        {
            return ex.error_code();
        }
        return spell_error_code::unknown;
    }
}

TEST_CASE("expand_vars")
{
    const auto env = variable_map{ { "A", "x" }, { "name", "foo" }, { "C", "${A}" } };

    SECTION("Known and unknown references")
    {
        CHECK(expand_vars("${A}/${B}", env) == "x/${B}");
        CHECK(expand_vars("${name}-${A}", env) == "foo-x");
        CHECK(expand_vars("no reference", env) == "no reference");
        CHECK(expand_vars("$A ${A", env) == "$A ${A");
        CHECK(expand_vars("${}", env) == "${}");
    }

    SECTION("Idempotent")
    {
        const auto once = expand_vars("${A}/${B}", env);
        CHECK(expand_vars(once, env) == once);
    }

    SECTION("Single pass")
    {
        CHECK(expand_vars("${C}", env) == "${A}");
    }
}

TEST_CASE("HashSpec")
{
    SECTION("Valid")
    {
        const auto hash = HashSpec::parse(
            "SHA256:9F86D081884C7D659A2FEAA0C55AD015A3BF4F1B2B0B822CD15D6C15B0F00A08"
        );
        REQUIRE(hash.has_value());
        CHECK(hash->algorithm == hash_algorithm::sha256);
        CHECK(hash->digest == "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");
        CHECK(hash->str() == "sha256:9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");

        const auto md5 = HashSpec::parse("md5:098f6bcd4621d373cade4e832627b4f6");
        REQUIRE(md5.has_value());
        CHECK(md5->algorithm == hash_algorithm::md5);
    }

    SECTION("Invalid")
    {
        CHECK_FALSE(HashSpec::parse("9f86d081").has_value());
        CHECK_FALSE(HashSpec::parse("crc32:0000").has_value());
        CHECK_FALSE(HashSpec::parse("md5:098f").has_value());
        CHECK_FALSE(HashSpec::parse("md5:zz8f6bcd4621d373cade4e832627b4f6").has_value());
        CHECK(
            HashSpec::parse("sha1:00").error().error_code() == spell_error_code::recipe_parse
        );
    }
}

TEST_CASE("Source names")
{
    CHECK(CurlSource{ "https://h.org/a/foo-1.0.tar.gz?x=1", {}, {} }.file_name() == "foo-1.0.tar.gz");
    CHECK(CurlSource{ "https://h.org/a/dl", {}, "foo.zip" }.file_name() == "foo.zip");
    CHECK(GitSource{ "https://h.org/a/repo.git", {}, {} }.dir_name() == "repo");
    CHECK(GitSource{ "https://h.org/a/repo/", {}, {} }.dir_name() == "repo");
    CHECK(GitSource{ "https://h.org/a/repo.git", {}, "src" }.dir_name() == "src");
}

TEST_CASE("Recipe::parse")
{
    SECTION("Full document")
    {
        const auto r = parse(
            R"(
name: foo
version: "1.0"
vars:
  A: x
source:
  - url: https://h.org/${name}-${version}.tar.gz
    hash: md5:098f6bcd4621d373cade4e832627b4f6
  - type: git
    url: https://h.org/${A}.git
    ref: v${version}
patches:
  - local.patch
  - /abs/other.patch
  - dir: patches
  - url: https://h.org/${A}.patch
build:
  - echo "${A}/${B}"
install:
  - make install PREFIX=${HOME_PREFIX}
runtime_deps: [bar]
build_deps: [baz, bar]
provides: [libfoo.so]
)",
            { { "HOME_PREFIX", "/opt" } }
        );

        CHECK(r.name() == "foo");
        CHECK(r.version() == "1.0");
        CHECK(r.full_name() == "foo-1.0");
        CHECK(r.variables().at("A") == "x");
        CHECK(r.path() == "/recipes/test.yml");

        REQUIRE(r.sources().size() == 2);
        const auto& curl = std::get<CurlSource>(r.sources()[0]);
        CHECK(curl.url == "https://h.org/foo-1.0.tar.gz");
        REQUIRE(curl.hash.has_value());
        CHECK(curl.hash->algorithm == hash_algorithm::md5);
        const auto& git = std::get<GitSource>(r.sources()[1]);
        CHECK(git.url == "https://h.org/x.git");
        CHECK(git.ref == "v1.0");

        REQUIRE(r.patches().size() == 4);
        CHECK(std::get<PatchFile>(r.patches()[0]).path == "/recipes/local.patch");
        CHECK(std::get<PatchFile>(r.patches()[1]).path == "/abs/other.patch");
        CHECK(std::get<PatchDir>(r.patches()[2]).dir == "/recipes/patches");
        CHECK(std::get<PatchUrl>(r.patches()[3]).url == "https://h.org/x.patch");

        CHECK(r.build_steps() == Recipe::command_list{ R"(echo "x/${B}")" });
        CHECK(r.install_steps() == Recipe::command_list{ "make install PREFIX=/opt" });
        CHECK(r.runtime_deps() == Recipe::name_list{ "bar" });
        CHECK(r.build_deps() == Recipe::name_list{ "baz", "bar" });
        CHECK(r.all_deps() == Recipe::name_list{ "bar", "baz" });
        CHECK(r.provides() == Recipe::name_list{ "libfoo.so" });
    }

    SECTION("vars override the environment")
    {
        const auto r = parse(
            "name: foo\nversion: '1'\nvars: {A: mine}\nbuild: ['${A} ${B}']\n",
            { { "A", "env" }, { "B", "env" } }
        );
        CHECK(r.build_steps() == Recipe::command_list{ "mine env" });
    }

    SECTION("name and version vars do not change the identity")
    {
        const auto r = parse(
            "name: foo\nversion: '1'\n"
            "vars: {name: bar, version: '9'}\n"
            "build: ['${name}-${version}']\n"
        );
        CHECK(r.name() == "foo");
        CHECK(r.version() == "1");
        CHECK(r.full_name() == "foo-1");
        CHECK(r.build_steps() == Recipe::command_list{ "bar-9" });
    }

    SECTION("Minimal document")
    {
        const auto r = parse("name: foo\nversion: 2\n");
        CHECK(r.version() == "2");
        CHECK(r.sources().empty());
        CHECK(r.patches().empty());
        CHECK(r.build_steps().empty());
        CHECK(r.all_deps().empty());
    }

    SECTION("Malformed documents")
    {
        CHECK(parse_error_code("version: '1.0'\n") == spell_error_code::recipe_parse);
        CHECK(parse_error_code("name: foo\n") == spell_error_code::recipe_parse);
        CHECK(parse_error_code("- a\n- b\n") == spell_error_code::recipe_parse);
        CHECK(parse_error_code("name: [foo\n") == spell_error_code::recipe_parse);
        CHECK(parse_error_code("name: a\nversion: 1\nbuild: make\n") == spell_error_code::recipe_parse);
        CHECK(
            parse_error_code("name: a\nversion: 1\nsource:\n  - type: svn\n    url: x\n")
            == spell_error_code::recipe_parse
        );
        CHECK(
            parse_error_code("name: a\nversion: 1\nsource:\n  - url: x\n    hash: sha256:00\n")
            == spell_error_code::recipe_parse
        );
        CHECK(parse_error_code("name: a\nversion: 1\nsource:\n  - hash: x\n") == spell_error_code::recipe_parse);
    }

    SECTION("Error message names the file")
    {
        CHECK_THROWS_WITH(
            parse("name: foo\n"),
            Catch::Matchers::ContainsSubstring("/recipes/test.yml")
                && Catch::Matchers::ContainsSubstring("version")
        );
    }
}

TEST_CASE("load_all_recipes")
{
    const auto recipes = load_all_recipes(spelltests::test_data_dir / "recipes", {});

    SECTION("Discovery")
    {
        REQUIRE(recipes.size() == 3);
        CHECK(recipes.count("hello") == 1);
        CHECK(recipes.count("libgreet") == 1);
        CHECK(recipes.count("tool") == 1);
    }

    SECTION("Content")
    {
        const auto& greet = recipes.at("libgreet");
        REQUIRE(greet.sources().size() == 1);
        CHECK(
            std::get<CurlSource>(greet.sources()[0]).url
            == "https://example.org/releases/libgreet-1.2.tar.gz"
        );
        CHECK(greet.build_steps().front() == "./configure --prefix=${PREFIX}");

        const auto& hello = recipes.at("hello");
        CHECK(hello.all_deps() == Recipe::name_list{ "libgreet", "tool" });
        REQUIRE(hello.patches().size() == 3);
        CHECK(
            std::get<PatchFile>(hello.patches()[0]).path.lexically_normal()
            == (spelltests::test_data_dir / "patches" / "fix-typo.patch").lexically_normal()
        );
    }

    SECTION("Missing directory")
    {
        CHECK(load_all_recipes(spelltests::test_data_dir / "does-not-exist", {}).empty());
    }

    SECTION("Load a single file")
    {
        const auto tool = Recipe::load(spelltests::test_data_dir / "recipes" / "extra" / "tool.yaml", {});
        CHECK(tool.build_steps() == Recipe::command_list{ "echo building tool" });
        CHECK_THROWS_AS(Recipe::load(spelltests::test_data_dir / "nope.yml", {}), spell_error);
    }
}
