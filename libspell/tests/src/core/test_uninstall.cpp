// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "spell/core/error_handling.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/uninstall.hpp"
#include "spell/core/util.hpp"

#include "spelltests.hpp"

using namespace spell;

namespace
{
    auto make_record(
        std::string name,
        std::vector<std::string> files = {},
        std::vector<std::string> deps = {}
    ) -> PackageRecord
    {
        auto rec = PackageRecord{};
        rec.name = std::move(name);
        rec.version = "1.0";
        rec.files = std::move(files);
        rec.runtime_deps = std::move(deps);
        return rec;
    }

    /** p depends on l, q depends on l, l depends on nothing, lone is standalone. */
    auto sample_registry() -> InMemoryRegistry
    {
        auto registry = InMemoryRegistry();
        registry.put(make_record("l"));
        registry.put(make_record("p", {}, { "l" }));
        registry.put(make_record("q", {}, { "l", "missing" }));
        registry.put(make_record("lone"));
        return registry;
    }
}

TEST_CASE("reverse_dependencies")
{
    const auto registry = sample_registry();
    CHECK(reverse_dependencies(registry, "l") == std::vector<std::string>{ "p", "q" });
    CHECK(reverse_dependencies(registry, "p").empty());
    CHECK(reverse_dependencies(registry, "missing") == std::vector<std::string>{ "q" });

    auto self = InMemoryRegistry();
    self.put(make_record("s", {}, { "s" }));
    CHECK(reverse_dependencies(self, "s").empty());
}

TEST_CASE("find_orphans")
{
    auto registry = sample_registry();
    CHECK(find_orphans(registry) == std::vector<std::string>{ "lone", "p", "q" });

    registry.remove("p");
    registry.remove("q");
    CHECK(find_orphans(registry) == std::vector<std::string>{ "l", "lone" });

    CHECK(find_orphans(InMemoryRegistry()).empty());
}

TEST_CASE("removal_order")
{
    const auto order = removal_order({ "/usr/bin/a", "/usr/share/doc/a/README", "/etc/a.conf", "/usr/lib/b" });
    REQUIRE(order.size() == 4);
    CHECK(order[0] == "/usr/share/doc/a/README");
    CHECK(order[1] == "/usr/bin/a");
    CHECK(order[2] == "/usr/lib/b");
    CHECK(order[3] == "/etc/a.conf");
}

TEST_CASE("uninstall")
{
    spelltests::context();
    auto tmp = TemporaryDirectory();
    const auto root = tmp.path() / "root";

    const auto bin = root / "usr" / "bin" / "q";
    const auto doc = root / "usr" / "share" / "doc" / "q" / "README";
    const auto other = root / "usr" / "share" / "other";
    spelltests::write_file(bin, "q");
    spelltests::write_file(doc, "doc");
    spelltests::write_file(other, "kept");

    auto registry = sample_registry();
    registry.put(make_record("q", { bin.string(), doc.string() }, { "l" }));

    SECTION("Not installed")
    {
        CHECK_FALSE(uninstall(registry, "nope", false, root));
        CHECK(registry.all().size() == 4);
    }

    SECTION("Blocked by dependents")
    {
        try
        {
            uninstall(registry, "l", false, root);
            FAIL("Expected the removal to be blocked");
        }
        catch (const spell_error& ex)
        {
            CHECK(ex.error_code() == spell_error_code::blocked_by_dependents);
            CHECK_THAT(ex.what(), Catch::Matchers::ContainsSubstring("required by p, q"));
            const auto* dependents = ex.data_as<std::vector<std::string>>();
            REQUIRE(dependents != nullptr);
            CHECK(*dependents == std::vector<std::string>{ "p", "q" });
        }
        CHECK(registry.contains("l"));
    }

    SECTION("Forced")
    {
        CHECK(uninstall(registry, "l", true, root));
        CHECK_FALSE(registry.contains("l"));
        CHECK(registry.contains("p"));
    }

    SECTION("Files and empty directories are removed")
    {
        CHECK(uninstall(registry, "q", false, root));
        CHECK_FALSE(registry.contains("q"));
        CHECK_FALSE(fs::exists(bin));
        CHECK_FALSE(fs::exists(doc));
        CHECK_FALSE(fs::exists(root / "usr" / "bin"));
        CHECK_FALSE(fs::exists(root / "usr" / "share" / "doc"));
        CHECK(fs::exists(other));
        CHECK(fs::is_directory(root));
    }

    SECTION("Already missing files are skipped")
    {
        fs::remove(doc);
        CHECK(uninstall(registry, "q", false, root));
        CHECK_FALSE(fs::exists(bin));
        CHECK_FALSE(registry.contains("q"));
    }

    SECTION("Symbolic links are removed, not their target")
    {
        const auto link = root / "usr" / "lib" / "libq.so";
        fs::create_directories(link.parent_path());
        fs::create_symlink(other, link);
        registry.put(make_record("q", { link.string() }, { "l" }));

        CHECK(uninstall(registry, "q", false, root));
        CHECK_FALSE(fs::exists(fs::symlink_status(link)));
        CHECK(fs::exists(other));
    }

    SECTION("Cleanup stops at the install root")
    {
        const auto top = root / "top-level-file";
        spelltests::write_file(top, "t");
        registry.put(make_record("q", { top.string() }, { "l" }));
        fs::remove(other);
        fs::remove_all(root / "usr");

        CHECK(uninstall(registry, "q", false, root.string() + "/"));
        CHECK(fs::is_directory(root));
    }
}
