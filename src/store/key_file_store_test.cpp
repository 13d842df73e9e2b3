//--------------------------------------------------------------------------------------------------
// Copyright (c) 2026 Marcus Geelnard
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

#include <store/key_file_store.hpp>

#include <base/env_utils.hpp>
#include <base/file_utils.hpp>
#include <store/memory_file_system.hpp>

#include <doctest/doctest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace kfstore;

namespace {
const time::seconds_t START_TIME = 1700000000;

class manual_time_source_t : public time_source_t {
public:
  time::seconds_t now() const override {
    return m_now;
  }

  void set_now(const time::seconds_t now) {
    m_now = now;
  }

private:
  time::seconds_t m_now = START_TIME;
};

config::settings_t make_settings(const std::string& file_dir) {
  config::settings_t settings;
  settings.file_dir = file_dir;
  return settings;
}
}  // namespace

TEST_CASE("Opening a store") {
  memory_file_system_t fs;
  manual_time_source_t clock;

  SUBCASE("A missing directory is created and claimed") {
    key_file_store_t store(make_settings("/data/store"), fs, clock);
    CHECK_EQ(store.dir(), "/data/store");
    CHECK(fs.dir_exists("/data/store"));
    CHECK_EQ(fs.get_permissions("/data/store"), 0700);
    CHECK(fs.file_exists("/data/store/.will_settings"));
  }

  SUBCASE("An empty directory is claimed") {
    fs.create_dir_with_parents("/data/store", 0755);
    key_file_store_t store(make_settings("/data/store"), fs, clock);
    CHECK_EQ(fs.get_permissions("/data/store"), 0700);
    CHECK(fs.file_exists("/data/store/.will_settings"));
  }

  SUBCASE("A directory with only sub directories is claimed") {
    fs.create_dir_with_parents("/data/store/sub", 0755);
    key_file_store_t store(make_settings("/data/store"), fs, clock);
    CHECK(fs.file_exists("/data/store/.will_settings"));
    CHECK(fs.dir_exists("/data/store/sub"));
  }

  SUBCASE("A directory with foreign files is left alone") {
    fs.create_dir_with_parents("/data/store", 0755);
    fs.write("important", "/data/store/notes.txt");
    CHECK_THROWS_AS(key_file_store_t(make_settings("/data/store"), fs, clock), store_init_error_t);
    CHECK_EQ(fs.read("/data/store/notes.txt"), "important");
    CHECK_FALSE(fs.file_exists("/data/store/.will_settings"));
    CHECK_EQ(fs.get_permissions("/data/store"), 0755);
  }

  SUBCASE("Reopening keeps the values and refreshes the marker") {
    {
      key_file_store_t store(make_settings("/data/store"), fs, clock);
      store.save("token", "abc123");
    }
    const auto marker_time = fs.modify_time("/data/store/.will_settings");
    fs.set_permissions("/data/store", 0755);

    key_file_store_t store(make_settings("/data/store"), fs, clock);
    CHECK_EQ(store.load("token").value(), "abc123");
    CHECK_GT(fs.modify_time("/data/store/.will_settings"), marker_time);
    CHECK_EQ(fs.get_permissions("/data/store"), 0700);
  }

  SUBCASE("A directory that can not be created is an I/O error") {
    fs.create_dir_with_parents("/locked", 0500);
    CHECK_THROWS_AS(key_file_store_t(make_settings("/locked/store"), fs, clock),
                    store_io_error_t);
  }
}

TEST_CASE("The store directory path is resolved") {
  memory_file_system_t fs;
  manual_time_source_t clock;

  SUBCASE("Home directory") {
    scoped_set_env_t home_env("HOME", "/home/bot");
    key_file_store_t store(make_settings("~/.kfstore"), fs, clock);
    CHECK_EQ(store.dir(), "/home/bot/.kfstore");
    CHECK(fs.file_exists("/home/bot/.kfstore/.will_settings"));
  }

  SUBCASE("Relative path") {
    key_file_store_t store(make_settings("settings/store"), fs, clock);
    CHECK(file::is_absolute_path(store.dir()));
    CHECK_EQ(store.dir(), file::absolute_path("settings/store"));
  }

  SUBCASE("Redundant path parts") {
    key_file_store_t store(make_settings("/data/./x/../store/"), fs, clock);
    CHECK_EQ(store.dir(), "/data/store");
  }
}

TEST_CASE("Saving and loading values") {
  memory_file_system_t fs;
  manual_time_source_t clock;
  key_file_store_t store(make_settings("/store"), fs, clock);

  SUBCASE("A missing key is not found") {
    CHECK_FALSE(store.load("missing").is_valid());
  }

  SUBCASE("A value is stored in a file named after the key") {
    store.save("greeting", "Hello world!");
    const auto item = store.load("greeting");
    REQUIRE(item.is_valid());
    CHECK_EQ(item.value(), "Hello world!");
    CHECK_EQ(fs.read("/store/greeting"), "Hello world!");
    CHECK_FALSE(fs.file_exists("/store/.greeting.expires"));
  }

  SUBCASE("Empty and binary values") {
    const std::string binary("a\0b\xff", 4);
    store.save("empty", "");
    store.save("binary", binary);
    CHECK(store.load("empty").is_valid());
    CHECK_EQ(store.load("empty").value(), "");
    CHECK_EQ(store.load("binary").value(), binary);
  }

  SUBCASE("Saving replaces the previous value") {
    store.save("key", "first");
    store.save("key", "second");
    CHECK_EQ(store.load("key").value(), "second");
  }

  SUBCASE("Keys may contain spaces and other punctuation") {
    store.save("my key-1_2.txt", "x");
    CHECK_EQ(store.load("my key-1_2.txt").value(), "x");
  }
}

TEST_CASE("Values with an expiry time") {
  memory_file_system_t fs;
  manual_time_source_t clock;
  key_file_store_t store(make_settings("/store"), fs, clock);

  store.save("session", "s3cr3t", START_TIME + 60);
  CHECK_EQ(fs.read("/store/.session.expires"), "1700000060");

  SUBCASE("Valid before the expiry time") {
    clock.set_now(START_TIME + 59);
    CHECK_EQ(store.load("session").value(), "s3cr3t");
  }

  SUBCASE("Valid at the expiry time") {
    clock.set_now(START_TIME + 60);
    CHECK_EQ(store.load("session").value(), "s3cr3t");
    CHECK(fs.file_exists("/store/session"));
  }

  SUBCASE("Gone after the expiry time, and the files are removed") {
    clock.set_now(START_TIME + 61);
    CHECK_FALSE(store.load("session").is_valid());
    CHECK_FALSE(fs.file_exists("/store/session"));
    CHECK_FALSE(fs.file_exists("/store/.session.expires"));

    // Still gone when the clock is turned back.
    clock.set_now(START_TIME);
    CHECK_FALSE(store.load("session").is_valid());
  }

  SUBCASE("Saving without an expiry time removes the old expiry time") {
    store.save("session", "forever");
    CHECK_FALSE(fs.file_exists("/store/.session.expires"));
    clock.set_now(START_TIME + 3600);
    CHECK_EQ(store.load("session").value(), "forever");
  }

  SUBCASE("Saving with a new expiry time replaces the old one") {
    store.save("session", "renewed", START_TIME + 120);
    clock.set_now(START_TIME + 100);
    CHECK_EQ(store.load("session").value(), "renewed");
  }

  SUBCASE("An expiry time in the past") {
    store.save("stale", "x", START_TIME - 1);
    CHECK_FALSE(store.load("stale").is_valid());
  }

  SUBCASE("A broken expiry file removes the value") {
    fs.write("tomorrow", "/store/.session.expires");
    CHECK_FALSE(store.load("session").is_valid());
    CHECK_FALSE(fs.file_exists("/store/session"));
    CHECK_FALSE(fs.file_exists("/store/.session.expires"));
  }
}

TEST_CASE("Clearing values") {
  memory_file_system_t fs;
  manual_time_source_t clock;
  key_file_store_t store(make_settings("/store"), fs, clock);
  store.save("a", "1");
  store.save("b", "2", START_TIME + 10);

  SUBCASE("clear removes the value and the expiry time") {
    store.clear("b");
    CHECK_FALSE(store.load("b").is_valid());
    CHECK_FALSE(fs.file_exists("/store/b"));
    CHECK_FALSE(fs.file_exists("/store/.b.expires"));
    CHECK_EQ(store.load("a").value(), "1");
  }

  SUBCASE("clear of a missing key is not an error") {
    store.clear("missing");
    store.clear("a");
    store.clear("a");
    CHECK_FALSE(store.load("a").is_valid());
  }

  SUBCASE("clear_all removes every file, including the marker") {
    store.clear_all();
    CHECK_FALSE(store.load("a").is_valid());
    CHECK_FALSE(store.load("b").is_valid());
    CHECK_FALSE(fs.file_exists("/store/.will_settings"));
    CHECK(fs.dir_exists("/store"));
    CHECK_EQ(store.size_bytes(), 0);
    CHECK_EQ(store.size(), "0.0B");

    // The store is still usable.
    store.save("c", "3");
    CHECK_EQ(store.load("c").value(), "3");
  }
}

TEST_CASE("Store size") {
  memory_file_system_t fs;
  manual_time_source_t clock;
  key_file_store_t store(make_settings("/store"), fs, clock);

  // The marker file is empty.
  CHECK_EQ(store.size_bytes(), 0);
  CHECK_EQ(store.size(), "0.0B");

  store.save("small", "hello");
  CHECK_EQ(store.size_bytes(), 5);
  CHECK_EQ(store.size(), "5.0B");

  // The expiry file counts too (ten digits).
  store.save("small", "hello", START_TIME + 1);
  CHECK_EQ(store.size_bytes(), 15);

  store.save("big", std::string(1536 - 15, 'x'));
  CHECK_EQ(store.size_bytes(), 1536);
  CHECK_EQ(store.size(), "1.5KiB");

  // Sub directories are not included.
  fs.create_dir_with_parents("/store/sub", 0755);
  fs.write("ignored", "/store/sub/file");
  CHECK_EQ(store.size_bytes(), 1536);
}

TEST_CASE("Purging expired values") {
  memory_file_system_t fs;
  manual_time_source_t clock;
  key_file_store_t store(make_settings("/store"), fs, clock);

  store.save("forever", "1");
  store.save("soon", "2", START_TIME + 10);
  store.save("later", "3", START_TIME + 100);

  CHECK_EQ(store.purge_expired(), 0);

  clock.set_now(START_TIME + 50);
  CHECK_EQ(store.purge_expired(), 1);
  CHECK_FALSE(fs.file_exists("/store/soon"));
  CHECK_FALSE(fs.file_exists("/store/.soon.expires"));
  CHECK(fs.file_exists("/store/later"));
  CHECK(fs.file_exists("/store/forever"));
  CHECK(fs.file_exists("/store/.will_settings"));

  clock.set_now(START_TIME + 1000);
  CHECK_EQ(store.purge_expired(), 1);
  CHECK_EQ(store.load("forever").value(), "1");
}

TEST_CASE("Invalid keys are rejected") {
  memory_file_system_t fs;
  manual_time_source_t clock;
  key_file_store_t store(make_settings("/store"), fs, clock);

  CHECK(key_file_store_t::is_valid_key("abc"));
  CHECK(key_file_store_t::is_valid_key("a.b"));

  for (const auto& key : {std::string(),
                          std::string("."),
                          std::string(".."),
                          std::string(".will_settings"),
                          std::string(".x.expires"),
                          std::string("a/b"),
                          std::string("../escape"),
                          std::string("nul\0byte", 8)}) {
    CHECK_FALSE(key_file_store_t::is_valid_key(key));
    CHECK_THROWS_AS(store.save(key, "x"), invalid_key_error_t);
    CHECK_THROWS_AS(store.save(key, "x", START_TIME), invalid_key_error_t);
    CHECK_THROWS_AS(store.load(key), invalid_key_error_t);
    CHECK_THROWS_AS(store.clear(key), invalid_key_error_t);
  }

  // Nothing but the marker was written.
  CHECK_EQ(fs.list_files("/store").size(), 1);
}

TEST_CASE("File system failures are reported as I/O errors") {
  memory_file_system_t fs;
  manual_time_source_t clock;
  key_file_store_t store(make_settings("/store"), fs, clock);
  store.save("a", "1", START_TIME + 10);

  // Read only store directory.
  fs.set_permissions("/store", 0500);

  CHECK_THROWS_AS(store.save("b", "2"), store_io_error_t);
  CHECK_THROWS_AS(store.clear("a"), store_io_error_t);
  CHECK_THROWS_AS(store.clear_all(), store_io_error_t);

  // Reading still works.
  CHECK_EQ(store.load("a").value(), "1");

  // ...but removing an expired value does not.
  clock.set_now(START_TIME + 11);
  CHECK_THROWS_AS(store.load("a"), store_io_error_t);

  // An I/O error is also a store error.
  CHECK_THROWS_AS(store.save("b", "2"), store_error_t);

  // Unlistable store directory.
  fs.set_permissions("/store", 0300);
  CHECK_THROWS_AS(store.size_bytes(), store_io_error_t);
  CHECK_THROWS_AS(store.purge_expired(), store_io_error_t);
}

TEST_CASE("Concurrent use of one store") {
  memory_file_system_t fs;
  manual_time_source_t clock;
  key_file_store_t store(make_settings("/store"), fs, clock);

  const int NUM_THREADS = 8;
  const int NUM_ITERATIONS = 200;
  std::atomic_int num_failures(0);

  std::vector<std::thread> threads;
  for (int t = 0; t < NUM_THREADS; ++t) {
    threads.emplace_back([&store, &num_failures, t] {
      const auto own_key = "thread" + std::to_string(t);
      for (int i = 0; i < NUM_ITERATIONS; ++i) {
        const auto value = std::to_string(i);
        store.save(own_key, value);
        if (store.load(own_key).value() != value) {
          ++num_failures;
        }

        // All threads write the same key. Any complete value is fine.
        store.save("shared", own_key, START_TIME + 10);
        const auto shared = store.load("shared");
        if (!shared.is_valid() || shared.value().compare(0, 6, "thread") != 0) {
          ++num_failures;
        }
      }
      store.clear(own_key);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  CHECK_EQ(num_failures.load(), 0);
  CHECK_FALSE(store.load("thread0").is_valid());
  CHECK(store.load("shared").is_valid());

  // The marker, "shared" and ".shared.expires".
  CHECK_EQ(fs.list_files("/store").size(), 3);
}

TEST_CASE("A store in the local file system") {
  const file::tmp_file_t tmp_dir(file::get_temp_dir(), "");
  const auto store_dir = file::absolute_path(file::append_path(tmp_dir.path(), "store"));

  {
    key_file_store_t store(make_settings(store_dir));
    CHECK_EQ(store.dir(), store_dir);
    CHECK_EQ(file::get_permissions(store_dir), 0700);
    CHECK(file::file_exists(file::append_path(store_dir, ".will_settings")));

    store.save("name", "value");
    store.save("ttl", "gone", time::seconds_since_epoch() - 10);
    CHECK_EQ(file::read(file::append_path(store_dir, "name")), "value");
    CHECK_FALSE(store.load("ttl").is_valid());
    CHECK_FALSE(file::file_exists(file::append_path(store_dir, "ttl")));
  }

  SUBCASE("Values survive reopening") {
    key_file_store_t store(make_settings(store_dir));
    CHECK_EQ(store.load("name").value(), "value");
    CHECK_EQ(store.size(), "5.0B");
  }

  SUBCASE("A foreign directory is refused") {
    const auto foreign_dir = file::append_path(tmp_dir.path(), "foreign");
    file::create_dir(foreign_dir);
    file::write("data", file::append_path(foreign_dir, "file.txt"));
    CHECK_THROWS_AS(key_file_store_t(make_settings(foreign_dir)), store_init_error_t);
  }

  SUBCASE("A key with the name of the next temporary file") {
    key_file_store_t store(make_settings(store_dir));

    // Derive the name that the next atomic write uses, without its leading period.
    const file::tmp_file_t current(store_dir, ".tmp");
    const auto name = file::get_file_part(current.path());
    const auto sep_pos = name.rfind('_');
    const auto number = std::stoll(name.substr(sep_pos + 1));
    const auto key = name.substr(1, sep_pos) + std::to_string(number + 1) + ".tmp";
    REQUIRE(key_file_store_t::is_valid_key(key));

    store.save(key, "value");
    CHECK_EQ(store.load(key).value(), "value");
    CHECK_EQ(file::read(file::append_path(store_dir, key)), "value");

    // Only "name" and this key, no temporary files.
    CHECK_EQ(store.size(), "10.0B");
  }

  SUBCASE("bootstrap uses the configured directory") {
    scoped_set_env_t config_env("KFSTORE_CONFIG_FILE",
                                file::append_path(tmp_dir.path(), "missing.json"));
    scoped_set_env_t dir_env("KFSTORE_FILE_DIR", store_dir);
    const auto store = bootstrap();
    REQUIRE(store);
    CHECK_EQ(store->dir(), store_dir);
  }
}
