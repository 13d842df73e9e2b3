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

#ifndef KFSTORE_KEY_FILE_STORE_HPP_
#define KFSTORE_KEY_FILE_STORE_HPP_

#include <base/time_utils.hpp>
#include <config/configuration.hpp>
#include <store/file_system.hpp>
#include <store/store_errors.hpp>
#include <store/time_source.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace kfstore {
/// @brief A persistent key/value store with one file per key.
///
/// The store takes ownership of a directory. Every key is stored in a file with the same name as
/// the key, and keys with an expiry time get a companion file, ".<key>.expires", that holds the
/// expiry time as decimal seconds since the Unix epoch. The directory is marked as ours with the
/// file ".will_settings".
///
/// All operations are synchronous. Operations on one store object are serialized, but nothing
/// protects the directory from other store objects or other processes.
class key_file_store_t {
public:
  /// @brief A stored value.
  class item_t {
  public:
    /// @brief Construct a valid data item.
    /// @param value The data string.
    item_t(const std::string& value) : m_value(value), m_is_valid(true) {
    }

    /// @brief Construct an invalid (empty) data item.
    item_t() {
    }

    /// @returns the data string.
    const std::string& value() const {
      return m_value;
    }

    /// @returns true if the item holds a value, or false if the key was not found (or expired).
    bool is_valid() const {
      return m_is_valid;
    }

  private:
    std::string m_value;
    bool m_is_valid = false;
  };

  /// @brief The name of the ownership marker file.
  static const char* const MARKER_FILE_NAME;

  /// @brief Open a store in the local file system, using the system clock.
  /// @param settings The settings. Only @c file_dir is used.
  /// @throws store_init_error_t if the directory contains files but no ownership marker.
  /// @throws store_io_error_t if the directory could not be created or claimed.
  explicit key_file_store_t(const config::settings_t& settings);

  /// @brief Open a store in the given file system, using the given clock.
  ///
  /// The file system and the clock must outlive the store.
  /// @throws store_init_error_t if the directory contains files but no ownership marker.
  /// @throws store_io_error_t if the directory could not be created or claimed.
  key_file_store_t(const config::settings_t& settings,
                   file_system_t& fs,
                   const time_source_t& clock);

  key_file_store_t(const key_file_store_t&) = delete;
  key_file_store_t& operator=(const key_file_store_t&) = delete;

  /// @brief Store a value that never expires.
  ///
  /// Any previous value is replaced, and any previous expiry time is removed.
  /// @throws invalid_key_error_t if the key can not be used as a file name.
  /// @throws store_io_error_t if the value could not be written.
  void save(const std::string& key, const std::string& value);

  /// @brief Store a value that expires.
  /// @param key The key.
  /// @param value The value.
  /// @param expire_at The value is gone once the current time is greater than this time.
  /// @throws invalid_key_error_t if the key can not be used as a file name.
  /// @throws store_io_error_t if the value could not be written.
  void save(const std::string& key, const std::string& value, const time::seconds_t expire_at);

  /// @brief Load a value.
  ///
  /// If the value has expired, its files are removed and an invalid item is returned. Note that
  /// this means that loading a value may modify the store.
  /// @returns a valid item if the key exists and has not expired, otherwise an invalid item.
  /// @throws invalid_key_error_t if the key can not be used as a file name.
  /// @throws store_io_error_t if an existing file could not be read or removed.
  item_t load(const std::string& key);

  /// @brief Remove a value and its expiry time. Removing a missing key is not an error.
  /// @throws invalid_key_error_t if the key can not be used as a file name.
  /// @throws store_io_error_t if a file could not be removed.
  void clear(const std::string& key);

  /// @brief Remove all files in the store directory, including the ownership marker.
  /// @throws store_io_error_t if the directory could not be listed or a file could not be removed.
  void clear_all();

  /// @returns the total size (in bytes) of all files in the store directory.
  /// @throws store_io_error_t if the directory could not be listed.
  int64_t size_bytes();

  /// @returns the total size of all files in the store directory as a human readable string,
  /// e.g. "1.5KiB".
  /// @throws store_io_error_t if the directory could not be listed.
  std::string size();

  /// @brief Remove all values that have expired.
  /// @returns the number of removed values.
  /// @throws store_io_error_t if the directory could not be listed or a file could not be removed.
  int purge_expired();

  /// @returns the absolute path to the store directory.
  const std::string& dir() const {
    return m_dir;
  }

  /// @brief Check if a string can be used as a key.
  ///
  /// A key must be a non-empty single file name component. It may not contain path separators or
  /// NUL characters, and may not start with a period (those names are reserved for the marker and
  /// the expiry files, and include "." and "..").
  static bool is_valid_key(const std::string& key);

private:
  void initialize(const std::string& file_dir);
  void save_impl(const std::string& key,
                 const std::string& value,
                 const time::seconds_t* expire_at);
  item_t load_impl(const std::string& key);
  bool expire_if_due(const std::string& key);
  void clear_impl(const std::string& key);
  std::string value_path(const std::string& key) const;
  std::string expire_path(const std::string& key) const;

  std::unique_ptr<file_system_t> m_owned_fs;
  std::unique_ptr<time_source_t> m_owned_clock;
  file_system_t* m_fs;
  const time_source_t* m_clock;

  std::string m_dir;
  std::string m_marker_path;

  std::mutex m_mutex;
};

/// @brief Open the store that is described by the process wide configuration.
///
/// This initializes the configuration (see config::init()) if necessary.
/// @throws runtime_error if the configuration file could not be parsed.
/// @throws store_init_error_t or store_io_error_t, as for the key_file_store_t constructor.
std::unique_ptr<key_file_store_t> bootstrap();

}  // namespace kfstore

#endif  // KFSTORE_KEY_FILE_STORE_HPP_
