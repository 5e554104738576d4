// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "spell/util/string.hpp"

using namespace spell::util;

TEST_CASE("to_lower")
{
    CHECK(to_lower('A') == 'a');
    CHECK(to_lower('-') == '-');
    CHECK(to_lower("Foo.TAR.GZ") == "foo.tar.gz");
}

TEST_CASE("starts_with / ends_with")
{
    CHECK(starts_with("name-1.0", "name"));
    CHECK(starts_with(".hidden", '.'));
    CHECK_FALSE(starts_with("", 'a'));
    CHECK(ends_with("foo.tar.zst", ".tar.zst"));
    CHECK(ends_with("path/", '/'));
    CHECK_FALSE(ends_with("zst", ".tar.zst"));

    const auto suffixes = std::array<std::string_view, 2>{ ".yml", ".yaml" };
    CHECK(ends_with_any("recipe.yaml", suffixes));
    CHECK_FALSE(ends_with_any("recipe.json", suffixes));
}

TEST_CASE("contains")
{
    CHECK(contains("libfoo", "foo"));
    CHECK(contains("a:b", ':'));
    CHECK_FALSE(contains("abc", "abd"));
}

TEST_CASE("remove_prefix / remove_suffix")
{
    CHECK(remove_prefix("sha256:abc", "sha256:") == "abc");
    CHECK(remove_prefix("abc", "sha256:") == "abc");
    CHECK(remove_suffix("foo.patch", ".patch") == "foo");
    CHECK(remove_suffix("foo", ".patch") == "foo");
}

TEST_CASE("strip")
{
    CHECK(strip("  hello \n") == "hello");
    CHECK(lstrip("  hello ") == "hello ");
    CHECK(rstrip("  hello ") == "  hello");
    CHECK(strip("") == "");
    CHECK(strip("//path//", '/') == "path");
}

TEST_CASE("split_once")
{
    const auto [head, tail] = split_once("sha256:abc:def", ':');
    CHECK(head == "sha256");
    REQUIRE(tail.has_value());
    CHECK(tail.value() == "abc:def");

    const auto [whole, none] = split_once("abc", ':');
    CHECK(whole == "abc");
    CHECK_FALSE(none.has_value());
}

TEST_CASE("split")
{
    CHECK(split("a:b:c", ':') == std::vector<std::string>{ "a", "b", "c" });
    CHECK(split("a::b", ":") == std::vector<std::string>{ "a", "", "b" });
    CHECK(split("a:b:c", ':', 1) == std::vector<std::string>{ "a", "b:c" });
    CHECK(split("abc", ':') == std::vector<std::string>{ "abc" });
    CHECK_THROWS_AS(split("abc", ""), std::invalid_argument);
}

TEST_CASE("join")
{
    CHECK(join(", ", std::vector<std::string>{ "a", "b", "c" }) == "a, b, c");
    CHECK(join(" -> ", std::vector<std::string>{ "a" }) == "a");
    CHECK(join(", ", std::vector<std::string>{}) == "");
}

TEST_CASE("replace_all")
{
    auto s = std::string("${A}/${A}");
    replace_all(s, "${A}", "x");
    CHECK(s == "x/x");

    auto t = std::string("aaa");
    replace_all(t, "a", "aa");
    CHECK(t == "aaaaaa");

    auto u = std::string("abc");
    replace_all(u, "", "x");
    CHECK(u == "abc");
}

TEST_CASE("concat")
{
    CHECK(concat("name", '-', std::string("1.0"), std::string_view(".tar.zst")) == "name-1.0.tar.zst");
}
