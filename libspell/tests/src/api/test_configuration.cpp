// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>

#include <catch2/catch_all.hpp>

#include "spell/api/configuration.hpp"
#include "spell/core/context.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/util.hpp"

#include "spelltests.hpp"

using namespace spell;

TEST_CASE("Configurable")
{
    auto c = Configurable("answer", "An answer", "SPELL_ANSWER");

    SECTION("No value")
    {
        CHECK_FALSE(c.configured());
        CHECK_THROWS_AS(c.value(), spell_error);
    }

    SECTION("Precedence")
    {
        c.set_default_value("1");
        CHECK(c.value() == "1");
        CHECK(c.source() == "default");

        c.set_rc_value("2", "/etc/spellrc");
        CHECK(c.value() == "2");
        CHECK(c.source() == "/etc/spellrc");

        c.set_env_value("3");
        CHECK(c.value() == "3");
        CHECK(c.source() == "env SPELL_ANSWER");

        c.get_cli_config() = "4";
        CHECK(c.value() == "4");
        CHECK(c.source() == "cli");

        c.clear_values();
        CHECK(c.value() == "4");
        c.get_cli_config().reset();
        CHECK_FALSE(c.configured());
    }

    SECTION("Conversions")
    {
        c.set_default_value("Yes");
        CHECK(c.as_bool());
        c.set_default_value("off");
        CHECK_FALSE(c.as_bool());
        c.set_default_value("maybe");
        CHECK_THROWS_AS(c.as_bool(), spell_error);

        c.set_default_value("42");
        CHECK(c.as_int() == 42);
        c.set_default_value("42abc");
        CHECK_THROWS_AS(c.as_int(), spell_error);
        c.set_default_value("");
        CHECK_THROWS_AS(c.as_int(), spell_error);

        c.set_default_value("/opt/spell");
        CHECK(c.as_path() == "/opt/spell");
    }
}

TEST_CASE("Configuration")
{
    spelltests::context();
    auto ctx = Context();
    auto config = Configuration(ctx);
    auto tmp = TemporaryDirectory();

    const auto home = tmp.path() / "home";
    auto env = util::environment_map{
        { "HOME", home.string() },
        { "XDG_CONFIG_HOME", (tmp.path() / "config").string() },
    };

    SECTION("Defaults")
    {
        config.load(env);
        CHECK(config.is_loaded());
        CHECK(ctx.paths.home == home / ".local" / "share" / "spell");
        CHECK(ctx.paths.recipes_dir == ctx.paths.home / "recipes");
        CHECK(ctx.paths.db_path == ctx.paths.home / "db.json");
        CHECK(ctx.build_params.install_root == "/");
        CHECK(ctx.build_params.prefix == "/usr");
        CHECK(ctx.build_params.use_fakeroot);
        CHECK(ctx.build_params.compression_level == 3);
        CHECK_FALSE(ctx.output_params.json);
        CHECK(config.rc_files().empty());
        CHECK(config.at("prefix").source() == "default");
    }

    SECTION("Environment")
    {
        env["SPELL_HOME"] = (tmp.path() / "spell").string();
        env["SPELL_ROOT"] = (tmp.path() / "root").string();
        env["SPELL_DB"] = "";
        env["NO_COLOR"] = "";
        config.load(env);
        CHECK(ctx.paths.home == tmp.path() / "spell");
        CHECK(ctx.paths.work_dir == tmp.path() / "spell" / "work");
        CHECK(ctx.paths.db_path == tmp.path() / "spell" / "db.json");
        CHECK(ctx.build_params.install_root == tmp.path() / "root");
        CHECK_FALSE(config.at("no_color").as_bool());

        env["NO_COLOR"] = "0";
        config.load(env);
        CHECK(config.at("no_color").as_bool());
        CHECK(ctx.graphics_params.no_color);
    }

    SECTION("Configuration files")
    {
        spelltests::write_file(
            tmp.path() / "config" / "spell" / "spellrc",
            "prefix: /opt\ncompression_level: 19\nuse_fakeroot: false\nrecipes_dir: /srv/recipes\n"
        );
        env["SPELL_HOME"] = (tmp.path() / "spell").string();
        spelltests::write_file(
            tmp.path() / "spell" / "spellrc",
            "prefix: /usr/local\nhome: /ignored\nunknown_key: 1\njson: true\n"
        );
        env["SPELL_RECIPES"] = "/env/recipes";

        config.load(env);
        CHECK(config.rc_files().size() == 2);
        CHECK(ctx.build_params.prefix == "/usr/local");
        CHECK(config.at("prefix").source() == (tmp.path() / "spell" / "spellrc").string());
        CHECK(ctx.build_params.compression_level == 19);
        CHECK_FALSE(ctx.build_params.use_fakeroot);
        CHECK(ctx.paths.home == tmp.path() / "spell");
        CHECK(ctx.paths.recipes_dir == "/env/recipes");
        CHECK_FALSE(ctx.output_params.json);
    }

    SECTION("Command line wins")
    {
        spelltests::write_file(tmp.path() / "config" / "spell" / "spellrc", "install_root: /mnt\n");
        env["SPELL_ROOT"] = "/from/env";
        config.at("install_root").get_cli_config() = "/from/cli";
        config.at("json").get_cli_config() = "true";
        config.load(env);
        CHECK(ctx.build_params.install_root == "/from/cli");
        CHECK(ctx.output_params.json);
        CHECK(config.at("install_root").source() == "cli");
    }

    SECTION("Invalid configuration file is skipped")
    {
        spelltests::write_file(tmp.path() / "config" / "spell" / "spellrc", "prefix: [unclosed\n");
        config.load(env);
        CHECK(config.rc_files().empty());
        CHECK(ctx.build_params.prefix == "/usr");
    }

    SECTION("Invalid values")
    {
        env["SPELL_HOME"] = (tmp.path() / "spell").string();
        spelltests::write_file(tmp.path() / "spell" / "spellrc", "compression_level: high\n");
        CHECK_THROWS_AS(config.load(env), spell_error);
    }

    SECTION("Unknown configurable")
    {
        CHECK_THROWS_AS(config.at("nope"), spell_error);
        CHECK(config.names().front() == "home");
    }

    SECTION("ensure_dirs")
    {
        env["SPELL_HOME"] = (tmp.path() / "spell").string();
        config.load(env);
        ensure_dirs(ctx);
        CHECK(fs::is_directory(ctx.paths.recipes_dir));
        CHECK(fs::is_directory(ctx.paths.work_dir));
        CHECK(fs::is_directory(ctx.paths.pkgs_dir));
        CHECK(fs::is_directory(ctx.paths.logs_dir));
    }

    // Put the shared logging level back
    spelltests::context().set_verbosity(0);
}
