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

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>

using namespace kfstore;

TEST_CASE("env_var_t reads and parses variables") {
  const std::string name("KFSTORE_TEST_VARIABLE");

  SUBCASE("An undefined variable is falsy and empty") {
    unset_env(name);
    const env_var_t var(name);
    CHECK_FALSE(static_cast<bool>(var));
    CHECK_EQ(var.as_string(), std::string());
  }

  SUBCASE("An empty variable is defined") {
    set_env(name, "");
    const env_var_t var(name);
    CHECK(static_cast<bool>(var));
    CHECK_EQ(var.as_string(), std::string());
  }

  SUBCASE("Integers") {
    set_env(name, "-1234567894561324");
    CHECK_EQ(env_var_t(name).as_int64(), -1234567894561324LL);

    set_env(name, "3");
    CHECK_EQ(env_var_t(name).as_int64(), 3);

    set_env(name, "three");
    CHECK_THROWS_AS(env_var_t(name).as_int64(), std::invalid_argument);
  }

  SUBCASE("The value is read at construction") {
    set_env(name, "before");
    const env_var_t var(name);
    set_env(name, "after");
    CHECK_EQ(var.as_string(), "before");
  }

  unset_env(name);
}

TEST_CASE("Scoped environment changes are undone") {
  const std::string name("KFSTORE_TEST_SCOPED");

  SUBCASE("scoped_set_env_t on an undefined variable") {
    unset_env(name);
    {
      scoped_set_env_t scoped_env(name, "Hello world!");
      CHECK_EQ(env_var_t(name).as_string(), "Hello world!");
    }
    CHECK_FALSE(static_cast<bool>(env_var_t(name)));
  }

  SUBCASE("scoped_set_env_t on a defined variable") {
    set_env(name, "Lorem ipsum");
    {
      scoped_set_env_t scoped_env(name, "Hello world!");
      CHECK_EQ(env_var_t(name).as_string(), "Hello world!");
    }
    CHECK_EQ(env_var_t(name).as_string(), "Lorem ipsum");
  }

  SUBCASE("scoped_unset_env_t") {
    set_env(name, "Lorem ipsum");
    {
      scoped_unset_env_t scoped_env(name);
      CHECK_FALSE(static_cast<bool>(env_var_t(name)));
    }
    CHECK_EQ(env_var_t(name).as_string(), "Lorem ipsum");
  }

  unset_env(name);
}
