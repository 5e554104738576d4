// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "spell/core/error_handling.hpp"

using namespace spell;

namespace
{
    auto half(int value) -> expected_t<int>
    {
        if (value % 2 != 0)
        {
            return make_unexpected("odd value", spell_error_code::incorrect_usage);
        }
        return value / 2;
    }

    auto quarter(int value) -> expected_t<int>
    {
        auto h = half(value);
        if (!h)
        {
            return forward_error(h);
        }
        return half(h.value());
    }
}

TEST_CASE("spell_error")
{
    SECTION("Code and message")
    {
        const auto err = spell_error("boom", spell_error_code::hash_mismatch);
        CHECK(std::string(err.what()) == "boom");
        CHECK(err.error_code() == spell_error_code::hash_mismatch);
        CHECK_FALSE(err.data().has_value());
        CHECK(err.data_as<int>() == nullptr);
    }

    SECTION("Payload")
    {
        const auto err = spell_error(
            "cycle",
            spell_error_code::dependency_cycle,
            std::vector<std::string>{ "x", "y" }
        );
        REQUIRE(err.data_as<std::vector<std::string>>() != nullptr);
        CHECK(*err.data_as<std::vector<std::string>>() == std::vector<std::string>{ "x", "y" });
        CHECK(err.data_as<std::string>() == nullptr);
    }

    SECTION("Subprocess payload")
    {
        const auto err = spell_error(
            "failed",
            spell_error_code::subprocess_failure,
            SubprocessFailure{ "make", 2, "/tmp/build-00.log" }
        );
        const auto* failure = err.data_as<SubprocessFailure>();
        REQUIRE(failure != nullptr);
        CHECK(failure->command == "make");
        CHECK(failure->exit_code == 2);
        CHECK(failure->log == "/tmp/build-00.log");
    }

    SECTION("Names")
    {
        CHECK(to_string(spell_error_code::dependency_cycle) == "dependency cycle");
        CHECK(to_string(spell_error_code::blocked_by_dependents) == "blocked by dependents");
        CHECK(to_string(spell_error_code::unknown) == "unknown error");
    }
}

TEST_CASE("expected helpers")
{
    SECTION("Value")
    {
        auto res = quarter(8);
        REQUIRE(res.has_value());
        CHECK(extract(res) == 2);
    }

    SECTION("Forwarded error")
    {
        auto res = quarter(6);
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().error_code() == spell_error_code::incorrect_usage);
        CHECK_THROWS_AS(extract(std::move(res)), spell_error);
    }

    SECTION("Void")
    {
        const expected_t<void> ok = {};
        CHECK_NOTHROW(extract(ok));
        const expected_t<void> ko = make_unexpected("ko", spell_error_code::internal_failure);
        CHECK_THROWS_AS(extract(ko), spell_error);
    }
}
