//--------------------------------------------------------------------------------------------------
// Copyright (c) 2020 Marcus Geelnard
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

#include <store/key_file_store.hpp>

#include <base/debug_utils.hpp>
#include <base/file_utils.hpp>
#include <store/local_file_system.hpp>

#include <stdexcept>

namespace kfstore {

namespace {
// The store directory is only accessible by its owner.
const file::mode_t STORE_DIR_MODE = 0700;

const std::string EXPIRE_FILE_PREFIX = ".";
const std::string EXPIRE_FILE_SUFFIX = ".expires";

// Turn an unexpected file system error into a store_io_error_t.
store_io_error_t io_error(const std::string& operation,
                          const std::string& subject,
                          const std::exception& e) {
  return store_io_error_t("Unable to " + operation + " \"" + subject + "\": " + e.what());
}

void check_key(const std::string& key) {
  if (!key_file_store_t::is_valid_key(key)) {
    throw invalid_key_error_t("Invalid key: \"" + key + "\"");
  }
}

// Extract the key from an expiry file name, e.g. ".foo.expires" -> "foo". An empty string is
// returned for file names that are not expiry file names.
std::string key_from_expire_file_name(const std::string& name) {
  const auto min_size = EXPIRE_FILE_PREFIX.size() + EXPIRE_FILE_SUFFIX.size();
  if (name.size() <= min_size) {
    return std::string();
  }
  const auto has_prefix =
      (name.compare(0, EXPIRE_FILE_PREFIX.size(), EXPIRE_FILE_PREFIX) == 0);
  const auto has_suffix = (name.compare(name.size() - EXPIRE_FILE_SUFFIX.size(),
                                        EXPIRE_FILE_SUFFIX.size(),
                                        EXPIRE_FILE_SUFFIX) == 0);
  if (!has_prefix || !has_suffix) {
    return std::string();
  }
  return name.substr(EXPIRE_FILE_PREFIX.size(), name.size() - min_size);
}
}  // namespace

const char* const key_file_store_t::MARKER_FILE_NAME = ".will_settings";

key_file_store_t::key_file_store_t(const config::settings_t& settings)
    : m_owned_fs(new local_file_system_t()),
      m_owned_clock(new system_time_source_t()),
      m_fs(m_owned_fs.get()),
      m_clock(m_owned_clock.get()) {
  initialize(settings.file_dir);
}

key_file_store_t::key_file_store_t(const config::settings_t& settings,
                                   file_system_t& fs,
                                   const time_source_t& clock)
    : m_fs(&fs), m_clock(&clock) {
  initialize(settings.file_dir);
}

void key_file_store_t::initialize(const std::string& file_dir) {
  try {
    m_dir = file::absolute_path(file::expand_user(file_dir));
  } catch (const std::runtime_error& e) {
    throw io_error("resolve the store directory", file_dir, e);
  }
  m_marker_path = file::append_path(m_dir, MARKER_FILE_NAME);
  debug::log(debug::DEBUG) << "Using " << m_dir << " for local setting storage";

  try {
    if (!m_fs->dir_exists(m_dir)) {
      // The directory doesn't exist, so create it.
      m_fs->create_dir_with_parents(m_dir, STORE_DIR_MODE);
      debug::log(debug::INFO) << "Created the store directory " << m_dir;
    } else if (!m_fs->file_exists(m_marker_path)) {
      // The directory exists, but it has not been claimed by us. We only claim it if it is empty,
      // since clear_all() removes every file in it.
      const auto files = m_fs->list_files(m_dir);
      if (!files.empty()) {
        debug::log(debug::ERROR) << "Refusing to use " << m_dir
                                 << " as a store directory: It holds " << files.size()
                                 << " file(s) but no " << MARKER_FILE_NAME;
        throw store_init_error_t(m_dir + " is not empty, the store needs an empty directory");
      }
      debug::log(debug::INFO) << "Claiming the empty directory " << m_dir;
    }

    // Update our dir & marker file.
    m_fs->set_permissions(m_dir, STORE_DIR_MODE);
    m_fs->touch(m_marker_path);
  } catch (const store_error_t&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw io_error("initialize the store directory", m_dir, e);
  }
}

void key_file_store_t::save(const std::string& key, const std::string& value) {
  check_key(key);
  std::lock_guard<std::mutex> guard(m_mutex);
  try {
    save_impl(key, value, nullptr);
  } catch (const std::runtime_error& e) {
    throw io_error("save", key, e);
  }
}

void key_file_store_t::save(const std::string& key,
                            const std::string& value,
                            const time::seconds_t expire_at) {
  check_key(key);
  std::lock_guard<std::mutex> guard(m_mutex);
  try {
    save_impl(key, value, &expire_at);
  } catch (const std::runtime_error& e) {
    throw io_error("save", key, e);
  }
}

key_file_store_t::item_t key_file_store_t::load(const std::string& key) {
  check_key(key);
  std::lock_guard<std::mutex> guard(m_mutex);
  try {
    return load_impl(key);
  } catch (const std::runtime_error& e) {
    throw io_error("load", key, e);
  }
}

void key_file_store_t::clear(const std::string& key) {
  check_key(key);
  std::lock_guard<std::mutex> guard(m_mutex);
  try {
    clear_impl(key);
  } catch (const std::runtime_error& e) {
    throw io_error("clear", key, e);
  }
}

void key_file_store_t::clear_all() {
  std::lock_guard<std::mutex> guard(m_mutex);
  try {
    const auto files = m_fs->list_files(m_dir);
    for (const auto& file : files) {
      m_fs->remove_file(file.path());
    }
    debug::log(debug::DEBUG) << "Removed " << files.size() << " file(s) from " << m_dir;
  } catch (const std::runtime_error& e) {
    throw io_error("clear", m_dir, e);
  }
}

int64_t key_file_store_t::size_bytes() {
  std::lock_guard<std::mutex> guard(m_mutex);
  try {
    int64_t total_size = 0;
    for (const auto& file : m_fs->list_files(m_dir)) {
      total_size += file.size();
    }
    return total_size;
  } catch (const std::runtime_error& e) {
    throw io_error("get the size of", m_dir, e);
  }
}

std::string key_file_store_t::size() {
  return file::human_readable_size(size_bytes());
}

int key_file_store_t::purge_expired() {
  std::lock_guard<std::mutex> guard(m_mutex);
  debug::log(debug::DEBUG) << "Purging expired values from " << m_dir;
  try {
    // Only keys that have an expiry file can expire.
    int num_purged = 0;
    for (const auto& file : m_fs->list_files(m_dir)) {
      const auto key = key_from_expire_file_name(file::get_file_part(file.path()));
      if (is_valid_key(key) && expire_if_due(key)) {
        ++num_purged;
      }
    }
    if (num_purged > 0) {
      debug::log(debug::INFO) << "Purged " << num_purged << " expired value(s) from " << m_dir;
    }
    return num_purged;
  } catch (const std::runtime_error& e) {
    throw io_error("purge expired values from", m_dir, e);
  }
}

bool key_file_store_t::is_valid_key(const std::string& key) {
  if (key.empty() || key[0] == '.') {
    return false;
  }
  return key.find('/') == std::string::npos && key.find('\0') == std::string::npos;
}

void key_file_store_t::save_impl(const std::string& key,
                                 const std::string& value,
                                 const time::seconds_t* expire_at) {
  m_fs->write(value, value_path(key));

  const auto expire_file = expire_path(key);
  if (expire_at != nullptr) {
    m_fs->write(time::to_string(*expire_at), expire_file);
  } else if (m_fs->file_exists(expire_file)) {
    m_fs->remove_file(expire_file);
  }
}

key_file_store_t::item_t key_file_store_t::load_impl(const std::string& key) {
  if (expire_if_due(key)) {
    return item_t();
  }

  const auto file_path = value_path(key);
  if (m_fs->file_exists(file_path)) {
    return item_t(m_fs->read(file_path));
  }
  return item_t();
}

bool key_file_store_t::expire_if_due(const std::string& key) {
  const auto expire_file = expire_path(key);
  if (!m_fs->file_exists(expire_file)) {
    return false;
  }

  time::seconds_t expire_at = 0;
  if (!time::parse(m_fs->read(expire_file), expire_at)) {
    debug::log(debug::WARNING) << "Removing broken store item \"" << key << "\" (bad expiry time)";
    clear_impl(key);
    return true;
  }

  // A value that expires at the current second is still valid.
  if (m_clock->now() > expire_at) {
    debug::log(debug::DEBUG) << "Removing expired store item \"" << key << "\"";
    clear_impl(key);
    return true;
  }

  return false;
}

void key_file_store_t::clear_impl(const std::string& key) {
  const auto file_path = value_path(key);
  if (m_fs->file_exists(file_path)) {
    m_fs->remove_file(file_path);
  }
  const auto expire_file = expire_path(key);
  if (m_fs->file_exists(expire_file)) {
    m_fs->remove_file(expire_file);
  }
}

std::string key_file_store_t::value_path(const std::string& key) const {
  return file::append_path(m_dir, key);
}

std::string key_file_store_t::expire_path(const std::string& key) const {
  return file::append_path(m_dir, EXPIRE_FILE_PREFIX + key + EXPIRE_FILE_SUFFIX);
}

std::unique_ptr<key_file_store_t> bootstrap() {
  config::init();
  return std::unique_ptr<key_file_store_t>(new key_file_store_t(config::settings()));
}

}  // namespace kfstore
