// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_all.hpp>

#include "spell/core/capabilities.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/package_handling.hpp"
#include "spell/core/pipeline.hpp"
#include "spell/core/recipe.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/util.hpp"

#include "spelltests.hpp"

using namespace spell;

namespace
{
    /** Local stand-in for the network and patch tools, installation is the real one. */
    class FakeCapabilities : public BuildCapabilities
    {
    public:

        explicit FakeCapabilities(const Context& context)
            : m_system(context)
        {
        }

        void fetch_url(const std::string& url, const fs::path& destination) override
        {
            fetched.push_back(url);
            fs::copy_file(url, destination, fs::copy_options::overwrite_existing);
        }

        void clone(
            const std::string& url,
            const std::optional<std::string>& ref,
            const fs::path& destination
        ) override
        {
            cloned.push_back(url);
            spelltests::write_file(destination / "REF", ref.value_or("HEAD"));
        }

        void extract(const fs::path& archive, const fs::path& destination) override
        {
            extracted.push_back(archive);
            extract_archive(archive, destination);
        }

        void apply_patch(const fs::path& patch, const fs::path& source_root, const fs::path& log) override
        {
            patches.emplace_back(patch, source_root);
            spelltests::write_file(log, "applied " + patch.filename().string());
        }

        void install_entry(const fs::path& staged, const fs::path& target) override
        {
            m_system.install_entry(staged, target);
        }

        std::vector<std::string> fetched;
        std::vector<std::string> cloned;
        std::vector<fs::path> extracted;
        std::vector<std::pair<fs::path, fs::path>> patches;

    private:

        SystemCapabilities m_system;
    };

    const std::string install_steps = R"(
install:
  - mkdir -p "$DESTDIR$PREFIX/bin" "$DESTDIR$PREFIX/share/hello"
  - cp built.txt "$DESTDIR$PREFIX/share/hello/greeting.txt"
  - echo run > "$DESTDIR$PREFIX/bin/hello"
  - ln -s hello "$DESTDIR$PREFIX/bin/hi"
)";

    /** A tarball holding ``hello-1.0/greeting.txt``. */
    auto make_tarball(const fs::path& dir) -> fs::path
    {
        spelltests::write_file(dir / "tree" / "hello-1.0" / "greeting.txt", "hello\n");
        const auto tarball = dir / "dist" / "hello-1.0.tar.zst";
        create_archive(dir / "tree", tarball, 3);
        return tarball;
    }

    auto hello_recipe(const fs::path& tarball, const std::string& hash, const std::string& extra = "")
        -> Recipe
    {
        const auto doc = "name: hello\nversion: '1.0'\nsource:\n  - url: " + tarball.string()
                         + "\n    hash: " + hash
                         + "\nbuild:\n  - cat greeting.txt > built.txt\n"
                           "  - test \"$SPELL_NAME-$SPELL_VERSION\" = hello-1.0\n"
                         + install_steps + extra;
        return Recipe::parse(doc, "", {});
    }

    auto sha256_of(const fs::path& file) -> std::string
    {
        return "sha256:" + file_digest(file, hash_algorithm::sha256);
    }
}

TEST_CASE("Workspace")
{
    auto sandbox = spelltests::Sandbox();
    const auto& ctx = spelltests::context();
    const auto recipe = Recipe::parse("name: foo\nversion: '1.0'\n", "", {});

    const auto ws = Workspace::of(ctx, recipe);
    CHECK(ws.root == ctx.paths.work_dir / "foo-1.0");
    CHECK(ws.src == ws.root / "src");
    CHECK(ws.build == ws.root / "build");
    CHECK(ws.destdir == ws.root / "destdir");
    CHECK(ws.logs == ctx.paths.logs_dir / "foo");

    CHECK(artifact_path(ctx, recipe) == ctx.paths.pkgs_dir / "foo-1.0.tar.zst");

    const auto env = build_environment(ctx, recipe, ws, ws.src / "foo-1.0");
    CHECK(env.at("DESTDIR") == ws.destdir.string());
    CHECK(env.at("PREFIX") == ctx.build_params.prefix);
    CHECK(env.at("SPELL_NAME") == "foo");
    CHECK(env.at("SPELL_VERSION") == "1.0");
    CHECK(env.at("SPELL_SRCDIR") == (ws.src / "foo-1.0").string());
    CHECK(env.count("PKG_CONFIG_PATH") == 1);
}

TEST_CASE("select_build_root")
{
    auto tmp = TemporaryDirectory();

    SECTION("Empty")
    {
        CHECK(select_build_root(tmp.path()) == tmp.path());
    }

    SECTION("Single directory next to files")
    {
        fs::create_directories(tmp.path() / "foo-1.0");
        fs::create_directories(tmp.path() / ".git");
        spelltests::write_file(tmp.path() / "foo-1.0.tar.gz", "");
        CHECK(select_build_root(tmp.path()) == tmp.path() / "foo-1.0");
    }

    SECTION("Several directories")
    {
        fs::create_directories(tmp.path() / "foo");
        fs::create_directories(tmp.path() / "bar");
        CHECK(select_build_root(tmp.path()) == tmp.path());
    }
}

TEST_CASE("verify_hash")
{
    auto tmp = TemporaryDirectory();
    const auto file = tmp.path() / "data";
    spelltests::write_file(file, "test");

    CHECK(
        file_digest(file, hash_algorithm::sha256)
        == "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08"
    );
    CHECK(file_digest(file, hash_algorithm::md5) == "098f6bcd4621d373cade4e832627b4f6");

    CHECK_NOTHROW(verify_hash(file, HashSpec{ hash_algorithm::md5, "098f6bcd4621d373cade4e832627b4f6" }));
    try
    {
        verify_hash(file, HashSpec{ hash_algorithm::md5, std::string(32, '0') });
        FAIL("Expected a hash mismatch");
    }
    catch (const spell_error& ex)
    {
        CHECK(ex.error_code() == spell_error_code::hash_mismatch);
        CHECK_THAT(ex.what(), Catch::Matchers::ContainsSubstring("got md5:098f6bcd"));
    }

    CHECK_THROWS_AS(file_digest(tmp.path() / "missing", hash_algorithm::sha256), spell_error);
}

TEST_CASE("Pipeline")
{
    auto sandbox = spelltests::Sandbox();
    const auto& ctx = spelltests::context();
    const auto tarball = make_tarball(sandbox.root());
    const auto root = sandbox.install_root();

    auto registry = InMemoryRegistry();
    auto caps = FakeCapabilities(ctx);
    auto pipeline = Pipeline(ctx, registry, caps);

    SECTION("Build and install")
    {
        const auto recipe = hello_recipe(tarball, sha256_of(tarball));
        pipeline.execute(recipe, true);

        CHECK(caps.fetched == std::vector<std::string>{ tarball.string() });
        REQUIRE(caps.extracted.size() == 1);

        const auto record = registry.get("hello");
        REQUIRE(record.has_value());
        CHECK(record->version == "1.0");
        CHECK(
            record->files
            == std::vector<std::string>{
                (root / "usr" / "bin" / "hello").lexically_normal().string(),
                (root / "usr" / "bin" / "hi").lexically_normal().string(),
                (root / "usr" / "share" / "hello" / "greeting.txt").lexically_normal().string(),
            }
        );

        CHECK(read_contents(root / "usr" / "share" / "hello" / "greeting.txt") == "hello\n");
        CHECK(read_contents(root / "usr" / "bin" / "hello") == "run\n");
        REQUIRE(fs::is_symlink(root / "usr" / "bin" / "hi"));
        CHECK(fs::read_symlink(root / "usr" / "bin" / "hi") == "hello");

        const auto artifact = artifact_path(ctx, recipe);
        REQUIRE(fs::exists(artifact));
        auto unpacked = TemporaryDirectory();
        extract_archive(artifact, unpacked.path());
        CHECK(read_contents(unpacked.path() / "usr" / "bin" / "hello") == "run\n");

        CHECK(fs::exists(ctx.paths.logs_dir / "hello" / "build-00.log"));
        CHECK(fs::exists(ctx.paths.logs_dir / "hello" / "install-03.log"));
    }

    SECTION("Installing again replaces the files")
    {
        const auto recipe = hello_recipe(tarball, sha256_of(tarball));
        pipeline.execute(recipe, true);
        spelltests::write_file(root / "usr" / "bin" / "hello", "stale\n");
        pipeline.execute(recipe, true);
        CHECK(read_contents(root / "usr" / "bin" / "hello") == "run\n");
        CHECK(registry.all().size() == 1);
    }

    SECTION("Build only")
    {
        const auto recipe = hello_recipe(tarball, sha256_of(tarball));
        pipeline.execute(recipe, false);

        const auto ws = Workspace::of(ctx, recipe);
        CHECK(read_contents(ws.src / "hello-1.0" / "built.txt") == "hello\n");
        CHECK_FALSE(registry.contains("hello"));
        CHECK_FALSE(fs::exists(artifact_path(ctx, recipe)));
        CHECK_FALSE(fs::exists(root / "usr"));
    }

    SECTION("Hash mismatch stops before extraction")
    {
        const auto recipe = hello_recipe(tarball, "sha256:" + std::string(64, '0'));
        try
        {
            pipeline.execute(recipe, true);
            FAIL("Expected a hash mismatch");
        }
        catch (const spell_error& ex)
        {
            CHECK(ex.error_code() == spell_error_code::hash_mismatch);
        }
        CHECK(caps.extracted.empty());
        CHECK_FALSE(registry.contains("hello"));
        CHECK_FALSE(fs::exists(root / "usr"));
    }

    SECTION("Failing step leaves the registry untouched")
    {
        const auto recipe = Recipe::parse(
            "name: broken\nversion: '1'\nbuild:\n  - echo compiling\n  - exit 4\n",
            "",
            {}
        );
        try
        {
            pipeline.execute(recipe, true);
            FAIL("Expected a subprocess failure");
        }
        catch (const spell_error& ex)
        {
            CHECK(ex.error_code() == spell_error_code::subprocess_failure);
            const auto* failure = ex.data_as<SubprocessFailure>();
            REQUIRE(failure != nullptr);
            CHECK(failure->exit_code == 4);
            CHECK(failure->log == ctx.paths.logs_dir / "broken" / "build-01.log");
        }
        CHECK(registry.all().empty());
    }

    SECTION("Patches are applied in order against the build root")
    {
        const auto patch_dir = sandbox.root() / "patches";
        spelltests::write_file(patch_dir / "b.patch", "");
        spelltests::write_file(patch_dir / "a.patch", "");
        spelltests::write_file(patch_dir / "notes.txt", "");
        spelltests::write_file(sandbox.root() / "first.patch", "");

        const auto recipe = hello_recipe(
            tarball,
            sha256_of(tarball),
            "patches:\n  - " + (sandbox.root() / "first.patch").string() + "\n  - dir: "
                + patch_dir.string() + "\n  - dir: " + (sandbox.root() / "missing").string() + "\n"
        );
        pipeline.execute(recipe, false);

        const auto build_root = Workspace::of(ctx, recipe).src / "hello-1.0";
        REQUIRE(caps.patches.size() == 3);
        CHECK(caps.patches[0].first == sandbox.root() / "first.patch");
        CHECK(caps.patches[1].first == patch_dir / "a.patch");
        CHECK(caps.patches[2].first == patch_dir / "b.patch");
        for (const auto& [patch, source_root] : caps.patches)
        {
            CHECK(source_root == build_root);
        }
        CHECK(read_contents(ctx.paths.logs_dir / "hello" / "patch-02.log") == "applied b.patch");
    }

    SECTION("Git sources")
    {
        const auto recipe = Recipe::parse(
            "name: repo\nversion: '2'\nsource:\n  - type: git\n    url: https://example.org/repo.git\n"
            "    ref: v2\nbuild:\n  - grep -q v2 REF\n",
            "",
            {}
        );
        pipeline.execute(recipe, false);
        CHECK(caps.cloned == std::vector<std::string>{ "https://example.org/repo.git" });
        CHECK(fs::exists(Workspace::of(ctx, recipe).src / "repo" / "REF"));
    }
}
