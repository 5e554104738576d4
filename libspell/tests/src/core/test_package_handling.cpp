// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "spell/core/error_handling.hpp"
#include "spell/core/package_handling.hpp"
#include "spell/core/util.hpp"

#include "spelltests.hpp"

using namespace spell;

TEST_CASE("is_archive_filename")
{
    CHECK(is_archive_filename("hello-2.12.tar.gz"));
    CHECK(is_archive_filename("hello-2.12.TAR.XZ"));
    CHECK(is_archive_filename("foo.tgz"));
    CHECK(is_archive_filename("foo.zip"));
    CHECK(is_archive_filename("foo.tar.zst"));
    CHECK(is_archive_filename("foo.7z"));
    CHECK_FALSE(is_archive_filename("fix.patch"));
    CHECK_FALSE(is_archive_filename("script.sh"));
    CHECK_FALSE(is_archive_filename("tarball"));
    CHECK_FALSE(is_archive_filename(""));
}

TEST_CASE("create_archive and extract_archive")
{
    auto tmp = TemporaryDirectory();
    const auto tree = tmp.path() / "tree";
    spelltests::write_file(tree / "usr" / "bin" / "hello", "#!/bin/sh\necho hello\n");
    spelltests::write_file(tree / "usr" / "share" / "doc" / "README", "read me\n");
    fs::create_directories(tree / "var" / "empty");
    fs::create_symlink("hello", tree / "usr" / "bin" / "hi");

    const auto artifact = tmp.path() / "pkgs" / "hello-1.0.tar.zst";
    create_archive(tree, artifact, 3);
    REQUIRE(fs::exists(artifact));
    CHECK(fs::file_size(artifact) > 0);

    const auto out = tmp.path() / "out";
    extract_archive(artifact, out);

    CHECK(read_contents(out / "usr" / "bin" / "hello") == "#!/bin/sh\necho hello\n");
    CHECK(read_contents(out / "usr" / "share" / "doc" / "README") == "read me\n");
    CHECK(fs::is_directory(out / "var" / "empty"));
    REQUIRE(fs::is_symlink(out / "usr" / "bin" / "hi"));
    CHECK(fs::read_symlink(out / "usr" / "bin" / "hi") == "hello");
}

TEST_CASE("Compression level is clamped")
{
    auto tmp = TemporaryDirectory();
    spelltests::write_file(tmp.path() / "tree" / "file", "content");
    CHECK_NOTHROW(create_archive(tmp.path() / "tree", tmp.path() / "low.tar.zst", -4));
    CHECK_NOTHROW(create_archive(tmp.path() / "tree", tmp.path() / "high.tar.zst", 99));

    extract_archive(tmp.path() / "high.tar.zst", tmp.path() / "out");
    CHECK(read_contents(tmp.path() / "out" / "file") == "content");
}

TEST_CASE("Archive errors")
{
    auto tmp = TemporaryDirectory();

    SECTION("Missing archive")
    {
        try
        {
            extract_archive(tmp.path() / "missing.tar.gz", tmp.path() / "out");
            FAIL("Expected an archive failure");
        }
        catch (const spell_error& ex)
        {
            CHECK(ex.error_code() == spell_error_code::archive_failure);
        }
    }

    SECTION("Entry written through an extracted symlink")
    {
        const auto outside = tmp.path() / "outside";
        const auto dest = tmp.path() / "dest";
        fs::create_directories(outside);

        fs::create_directories(tmp.path() / "first");
        fs::create_symlink(outside, tmp.path() / "first" / "link");
        create_archive(tmp.path() / "first", tmp.path() / "first.tar.zst", 3);

        spelltests::write_file(tmp.path() / "second" / "link" / "evil", "evil");
        create_archive(tmp.path() / "second", tmp.path() / "second.tar.zst", 3);

        extract_archive(tmp.path() / "first.tar.zst", dest);
        REQUIRE(fs::is_symlink(dest / "link"));
        try
        {
            extract_archive(tmp.path() / "second.tar.zst", dest);
            FAIL("Expected an archive failure");
        }
        catch (const spell_error& ex)
        {
            CHECK(ex.error_code() == spell_error_code::archive_failure);
        }
        CHECK_FALSE(fs::exists(outside / "evil"));
    }

    SECTION("Destination reached through a symlink")
    {
        fs::create_directories(tmp.path() / "real");
        fs::create_symlink(tmp.path() / "real", tmp.path() / "alias");
        spelltests::write_file(tmp.path() / "tree" / "sub" / "file", "content");
        create_archive(tmp.path() / "tree", tmp.path() / "tree.tar.zst", 3);

        extract_archive(tmp.path() / "tree.tar.zst", tmp.path() / "alias");
        CHECK(read_contents(tmp.path() / "real" / "sub" / "file") == "content");
    }

    SECTION("Missing directory to archive")
    {
        CHECK_THROWS_AS(
            create_archive(tmp.path() / "nothing", tmp.path() / "out.tar.zst", 3),
            spell_error
        );
    }
}
