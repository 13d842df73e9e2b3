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

#ifndef KFSTORE_FILE_SYSTEM_HPP_
#define KFSTORE_FILE_SYSTEM_HPP_

#include <base/file_utils.hpp>

#include <string>
#include <vector>

namespace kfstore {

/// @brief The file system operations that the key file store depends on.
///
/// All paths are absolute. Every operation throws std::runtime_error (or a subclass) on failure.
class file_system_t {
public:
  virtual ~file_system_t();

  /// @returns true if a regular file exists at the given path.
  virtual bool file_exists(const std::string& path) const = 0;

  /// @returns true if a directory exists at the given path.
  virtual bool dir_exists(const std::string& path) const = 0;

  /// @brief Read the full content of a file.
  virtual std::string read(const std::string& path) const = 0;

  /// @brief Create or truncate a file and write data to it.
  /// @param data The new content of the file.
  /// @param path The path to the file. The parent directory must exist.
  virtual void write(const std::string& data, const std::string& path) = 0;

  /// @brief Remove a regular file.
  virtual void remove_file(const std::string& path) = 0;

  /// @brief List the regular files directly inside a directory.
  /// @returns file information (path, size, modification time) for every regular file. Sub
  /// directories and their contents are not included.
  virtual std::vector<file::file_info_t> list_files(const std::string& path) const = 0;

  /// @brief Create a directory and any missing parent directories.
  /// @param mode The permission bits for the created directories.
  virtual void create_dir_with_parents(const std::string& path, const file::mode_t mode) = 0;

  /// @brief Set the permission bits of a file or directory.
  virtual void set_permissions(const std::string& path, const file::mode_t mode) = 0;

  /// @brief Create a file if necessary and update its modification time.
  virtual void touch(const std::string& path) = 0;

protected:
  // Constructor called by child classes.
  file_system_t();

private:
  // Prohibit copy & assignment.
  file_system_t(const file_system_t&) = delete;
  file_system_t& operator=(const file_system_t&) = delete;
};

}  // namespace kfstore

#endif  // KFSTORE_FILE_SYSTEM_HPP_
