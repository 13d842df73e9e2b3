//--------------------------------------------------------------------------------------------------
// Copyright (c) 2019 Marcus Geelnard
// Altered source version: modified for the kfstore key/value store, 2026.
//
// This software is provided 'as-is', without any express or implied warranty. In no event will the
// authors be held liable for any damages arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose, including commercial
// applications, and to alter it and redistribute it freely, subject to the following restrictions:
//
//  1. The origin of this software must not be misrepresented; you must not claim that you wrote
//     the original software. If you use this software in a product, an acknowledgment in the
//     product documentation would be appreciated but is not required.
//
//  2. Altered source versions must be plainly marked as such, and must not be misrepresented as
//     being the original software.
//
//  3. This notice may not be removed or altered from any source distribution.
//--------------------------------------------------------------------------------------------------

#include <base/env_utils.hpp>
#include <base/file_utils.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <stdexcept>
#include <string>

using namespace kfstore;

TEST_CASE("tmp_file_t produces expected results") {
  SUBCASE("A full path is constructed properly") {
    const std::string base_path = file::append_path("hello", "world");
    const std::string ext = ".myext";

    const file::tmp_file_t result(base_path, ext);

    // The base path and the extension are part of the final file name (and in the right places).
    CHECK_EQ(result.path().find(base_path), 0);
    CHECK_EQ(result.path().find(ext), result.path().size() - ext.size());

    // The file name contains some temporary string part.
    const auto min_expected_size = base_path.size() + ext.size() + 6;
    CHECK_GT(result.path().size(), min_expected_size);

    // The file name is hidden.
    CHECK_EQ(file::get_file_part(result.path())[0], '.');
  }

  SUBCASE("A directory is created and completely removed") {
    std::string tmp_dir_path;
    std::string tmp_file_path;
    {
      const file::tmp_file_t tmp(file::get_temp_dir(), "");
      tmp_dir_path = tmp.path();
      tmp_file_path = file::append_path(file::append_path(tmp_dir_path, "sub"), "hello.foo");

      file::create_dir_with_parents(file::get_dir_part(tmp_file_path));
      file::write("Hello world!", tmp_file_path);

      CHECK_EQ(file::dir_exists(tmp_dir_path), true);
      CHECK_EQ(file::file_exists(tmp_file_path), true);
    }

    // After the tmp_file_t object goes out of scope, the file and the dir should be deleted.
    CHECK_EQ(file::dir_exists(tmp_dir_path), false);
    CHECK_EQ(file::file_exists(tmp_file_path), false);
  }
}

TEST_CASE("append_path produces expected results") {
  CHECK_EQ(file::append_path("hello", "world"), "hello/world");
  CHECK_EQ(file::append_path("", "world"), "world");
  CHECK_EQ(file::append_path("hello", ""), "hello");
}

TEST_CASE("get_dir_part and get_file_part split paths") {
  CHECK_EQ(file::get_dir_part("/var/lib/settings"), "/var/lib");
  CHECK_EQ(file::get_file_part("/var/lib/settings"), "settings");
  CHECK_EQ(file::get_dir_part("settings"), "");
  CHECK_EQ(file::get_file_part("settings"), "settings");
}

TEST_CASE("expand_user replaces a leading tilde") {
  scoped_set_env_t home("HOME", "/home/tester");

  CHECK_EQ(file::expand_user("~"), "/home/tester");
  CHECK_EQ(file::expand_user("~/settings"), "/home/tester/settings");
  CHECK_EQ(file::expand_user("/tmp/~/settings"), "/tmp/~/settings");
  CHECK_EQ(file::expand_user("relative/path"), "relative/path");

  // Unknown users are left alone.
  CHECK_EQ(file::expand_user("~no_such_user_kfstore/x"), "~no_such_user_kfstore/x");
}

TEST_CASE("absolute_path normalizes paths") {
  SUBCASE("Absolute paths") {
    CHECK_EQ(file::absolute_path("/var/lib/settings"), "/var/lib/settings");
    CHECK_EQ(file::absolute_path("/var//lib/./settings/"), "/var/lib/settings");
    CHECK_EQ(file::absolute_path("/var/lib/../settings"), "/var/settings");
    CHECK_EQ(file::absolute_path("/.."), "/");
  }

  SUBCASE("Relative paths are made absolute") {
    const auto result = file::absolute_path("some/dir");
    CHECK(file::is_absolute_path(result));
    CHECK_EQ(file::get_file_part(result), "dir");
    CHECK_EQ(file::get_file_part(file::get_dir_part(result)), "some");
  }
}

TEST_CASE("human_readable_size uses binary units with one decimal") {
  CHECK_EQ(file::human_readable_size(0), "0.0B");
  CHECK_EQ(file::human_readable_size(13), "13.0B");
  CHECK_EQ(file::human_readable_size(1023), "1023.0B");
  CHECK_EQ(file::human_readable_size(1024), "1.0KiB");
  CHECK_EQ(file::human_readable_size(1536), "1.5KiB");
  CHECK_EQ(file::human_readable_size(5L * 1024L * 1024L * 1024L), "5.0GiB");
}

TEST_CASE("File contents, permissions and listings") {
  const file::tmp_file_t tmp_dir(file::get_temp_dir(), "");
  file::create_dir(tmp_dir.path(), 0755);
  const auto path = file::append_path(tmp_dir.path(), "data");

  SUBCASE("write replaces the content and read returns it") {
    file::write("a long first value", path);
    file::write("short", path);
    CHECK_EQ(file::read(path), "short");
  }

  SUBCASE("write_atomic replaces the content and leaves no temporary file") {
    file::write("old", path);
    file::write_atomic(std::string("new\0value", 9), path);
    CHECK_EQ(file::read(path), std::string("new\0value", 9));
    CHECK_EQ(file::list_directory(tmp_dir.path()).size(), 1);
  }

  SUBCASE("append adds to the end") {
    file::append("one,", path);
    file::append("two", path);
    CHECK_EQ(file::read(path), "one,two");
  }

  SUBCASE("Reading a missing file throws") {
    CHECK_THROWS_AS(file::read(path), std::runtime_error);
  }

  SUBCASE("touch creates an empty file and keeps existing content") {
    file::touch(path);
    CHECK(file::file_exists(path));
    CHECK_EQ(file::get_file_info(path).size(), 0);

    file::write("keep", path);
    file::touch(path);
    CHECK_EQ(file::read(path), "keep");
  }

  SUBCASE("set_permissions changes the mode bits") {
    file::set_permissions(tmp_dir.path(), 0700);
    CHECK_EQ(file::get_permissions(tmp_dir.path()), 0700u);
    file::set_permissions(tmp_dir.path(), 0755);
    CHECK_EQ(file::get_permissions(tmp_dir.path()), 0755u);
  }

  SUBCASE("list_directory is not recursive") {
    file::write("12345", path);
    const auto sub_dir = file::append_path(tmp_dir.path(), "sub");
    file::create_dir(sub_dir);
    file::write("hidden in a sub dir", file::append_path(sub_dir, "nested"));

    const auto entries = file::list_directory(tmp_dir.path());
    REQUIRE_EQ(entries.size(), 2);
    const auto file_it =
        std::find_if(entries.begin(), entries.end(), [](const file::file_info_t& e) {
          return !e.is_dir();
        });
    REQUIRE(file_it != entries.end());
    CHECK_EQ(file_it->path(), path);
    CHECK_EQ(file_it->size(), 5);

    // walk_directory does recurse.
    CHECK_EQ(file::walk_directory(tmp_dir.path()).size(), 3);
  }

  SUBCASE("create_dir_with_parents applies the mode to new directories") {
    const auto deep = file::append_path(file::append_path(tmp_dir.path(), "a"), "b");
    file::create_dir_with_parents(deep, 0700);
    CHECK(file::dir_exists(deep));
    CHECK_EQ(file::get_permissions(deep) & 0077u, 0u);
  }
}
