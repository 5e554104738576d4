// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "spell/api/install.hpp"
#include "spell/api/update.hpp"
#include "spell/core/capabilities.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/recipe.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/util.hpp"

#include "spelltests.hpp"

using namespace spell;

namespace
{
    void add_recipe(recipe_map& recipes, const std::string& doc)
    {
        auto recipe = Recipe::parse(doc, "", {});
        auto name = recipe.name();
        recipes.insert_or_assign(std::move(name), std::move(recipe));
    }

    /** A recipe installing ``/usr/share/<name>/version``. */
    auto installing_recipe(const std::string& name, const std::string& version, const std::string& deps)
        -> std::string
    {
        return "name: " + name + "\nversion: '" + version + "'\nruntime_deps: [" + deps
               + "]\ninstall:\n  - mkdir -p \"$DESTDIR$PREFIX/share/$SPELL_NAME\"\n"
                 "  - echo $SPELL_VERSION > \"$DESTDIR$PREFIX/share/$SPELL_NAME/version\"\n";
    }

    auto sample_recipes() -> recipe_map
    {
        auto recipes = recipe_map();
        add_recipe(recipes, installing_recipe("base", "1.0", ""));
        add_recipe(recipes, installing_recipe("lib", "2.0", "base"));
        add_recipe(recipes, installing_recipe("app", "3.0", "lib, ghost"));
        return recipes;
    }

    auto record(const std::string& name, const std::string& version) -> PackageRecord
    {
        auto rec = PackageRecord{};
        rec.name = name;
        rec.version = version;
        return rec;
    }
}

TEST_CASE("plan_build")
{
    const auto recipes = sample_recipes();
    auto registry = InMemoryRegistry();

    SECTION("Nothing installed")
    {
        const auto plan = detail::plan_build(recipes, registry, { "app" }, true);
        CHECK(plan.order == std::vector<std::string>{ "base", "lib", "app" });
        CHECK(plan.skipped.empty());
    }

    SECTION("Installed dependencies at the recipe version are skipped")
    {
        registry.put(record("base", "1.0"));
        registry.put(record("lib", "1.5"));
        registry.put(record("app", "3.0"));
        const auto plan = detail::plan_build(recipes, registry, { "app" }, true);
        CHECK(plan.order == std::vector<std::string>{ "lib", "app" });
        CHECK(plan.skipped == std::vector<std::string>{ "base" });

        const auto full = detail::plan_build(recipes, registry, { "app" }, false);
        CHECK(full.order == std::vector<std::string>{ "base", "lib", "app" });
    }

    SECTION("Several targets")
    {
        const auto plan = detail::plan_build(recipes, registry, { "lib", "base" }, true);
        CHECK(plan.order == std::vector<std::string>{ "base", "lib" });
    }

    SECTION("Errors")
    {
        CHECK_THROWS_AS(detail::plan_build(recipes, registry, {}, true), spell_error);
        try
        {
            [[maybe_unused]] const auto plan = detail::plan_build(recipes, registry, { "nope" }, true);
            FAIL("Expected a missing recipe");
        }
        catch (const spell_error& ex)
        {
            CHECK(ex.error_code() == spell_error_code::recipe_not_found);
            CHECK_THAT(ex.what(), Catch::Matchers::ContainsSubstring("nope"));
        }
    }
}

TEST_CASE("run_build_plan")
{
    auto sandbox = spelltests::Sandbox();
    const auto& ctx = spelltests::context();
    const auto recipes = sample_recipes();
    auto registry = JsonFileRegistry(ctx.paths.db_path);
    auto caps = SystemCapabilities(ctx);

    const auto share = sandbox.install_root() / "usr" / "share";

    SECTION("Install in dependency order")
    {
        const auto plan = detail::plan_build(recipes, registry, { "app" }, true);
        detail::run_build_plan(ctx, recipes, registry, caps, plan, true);

        CHECK(read_contents(share / "base" / "version") == "1.0\n");
        CHECK(read_contents(share / "app" / "version") == "3.0\n");
        const auto installed = JsonFileRegistry(ctx.paths.db_path).all();
        REQUIRE(installed.size() == 3);
        CHECK(installed.at("app").runtime_deps == std::vector<std::string>{ "lib", "ghost" });
        CHECK(
            installed.at("lib").files
            == std::vector<std::string>{ (share / "lib" / "version").lexically_normal().string() }
        );
    }

    SECTION("Build only")
    {
        const auto plan = detail::plan_build(recipes, registry, { "lib" }, true);
        detail::run_build_plan(ctx, recipes, registry, caps, plan, false);
        CHECK(registry.all().empty());
        CHECK_FALSE(fs::exists(share));
    }
}

TEST_CASE("upgrade_packages")
{
    auto sandbox = spelltests::Sandbox();
    const auto& ctx = spelltests::context();
    auto caps = SystemCapabilities(ctx);
    const auto share = sandbox.install_root() / "usr" / "share";

    auto recipes = sample_recipes();
    auto registry = InMemoryRegistry();
    registry.put(record("base", "0.9"));
    registry.put(record("app", "3.0"));

    SECTION("Outdated target with a missing dependency")
    {
        add_recipe(recipes, installing_recipe("app", "3.1", "lib"));
        const auto built = detail::upgrade_packages(ctx, recipes, registry, caps, { "app" });
        CHECK(built == std::vector<std::string>{ "lib", "app" });
        CHECK(registry.get("app")->version == "3.1");
        CHECK(registry.get("base")->version == "0.9");
        CHECK(read_contents(share / "app" / "version") == "3.1\n");
    }

    SECTION("Up to date and unknown targets")
    {
        const auto built = detail::upgrade_packages(ctx, recipes, registry, caps, { "app", "ghost" });
        CHECK(built.empty());
        CHECK(registry.get("app")->version == "3.0");
    }

    SECTION("Installed dependency of another version is upgraded when targeted")
    {
        const auto built = detail::upgrade_packages(ctx, recipes, registry, caps, { "base" });
        CHECK(built == std::vector<std::string>{ "base" });
        CHECK(registry.get("base")->version == "1.0");
    }
}
