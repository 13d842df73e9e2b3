//--------------------------------------------------------------------------------------------------
// Copyright (c) 2018 Marcus Geelnard
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

#ifndef KFSTORE_FILE_UTILS_HPP_
#define KFSTORE_FILE_UTILS_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace kfstore {
namespace file {
/// @brief Permission bits for a file or directory (e.g. 0700).
using mode_t = unsigned int;

/// @brief A helper class for handling temporary files and directories.
///
/// When the temp file object is created, a temporary file name is generated. The file name starts
/// with a period. Once the object goes out of scope, it removes the file or directory (recursively)
/// from disk.
class tmp_file_t {
public:
  /// @brief Construct a temporary file name.
  /// @param dir The base directory in which the temporary file will be located.
  /// @param extension The file name extension (including the leading dot).
  tmp_file_t(const std::string& dir, const std::string& extension);

  /// @brief Remove the temporary file or directory (if any).
  ~tmp_file_t();

  tmp_file_t(const tmp_file_t&) = delete;
  tmp_file_t& operator=(const tmp_file_t&) = delete;

  const std::string& path() const {
    return m_path;
  }

private:
  std::string m_path;
};

/// @brief Information about a directory entry.
class file_info_t {
public:
  /// @brief File time (seconds since the Unix epoch).
  using time_t = int64_t;

  file_info_t(const std::string& path,
              const time_t modify_time,
              const int64_t size,
              const bool is_dir);

  /// @returns the full path to the file.
  const std::string& path() const {
    return m_path;
  }

  /// @returns the last modification time of the file.
  time_t modify_time() const {
    return m_modify_time;
  }

  /// @returns the size of the file in bytes (zero for directories).
  int64_t size() const {
    return m_size;
  }

  /// @returns true if the entry is a directory.
  bool is_dir() const {
    return m_is_dir;
  }

private:
  std::string m_path;
  time_t m_modify_time;
  int64_t m_size;
  bool m_is_dir;
};

///@{
/// @brief Append two paths.
/// @param path The base path.
/// @param append The path to be appended (e.g. a file name).
/// @returns the concatenated paths, using the system path separator.
/// @note If @c path is empty or @c append is empty, the result will not contain any path separator.
std::string append_path(const std::string& path, const std::string& append);
std::string append_path(const std::string& path, const char* append);
///@}

/// @brief Get the file name part of a path.
/// @returns The part of the path after the final path separator. If the path does not contain a
/// separator, the entire path is returned.
std::string get_file_part(const std::string& path);

/// @brief Get the directory part of a path.
/// @returns The part of the path before the final path separator. If the path does not contain a
/// separator, an empty string is returned.
std::string get_dir_part(const std::string& path);

/// @brief Get a temporary directory for this user and process.
/// @returns the full path to the temporary directory.
std::string get_temp_dir();

/// @brief Get the user home directory.
/// @returns the full path to the user home directory, or an empty string if it is unknown.
std::string get_user_home_dir();

/// @brief Expand a leading "~" or "~user" path component to a home directory.
///
/// Paths that do not start with "~", and "~user" forms for unknown users, are returned unchanged.
std::string expand_user(const std::string& path);

/// @brief Check if a path is absolute.
bool is_absolute_path(const std::string& path);

/// @brief Make a path absolute.
///
/// Relative paths are taken relative to the current working directory. The result is normalized
/// ("." and ".." components and repeated separators are removed) but symbolic links are not
/// resolved, and the path does not need to exist.
/// @throws runtime_error if the current working directory could not be determined.
std::string absolute_path(const std::string& path);

/// @brief Get file information about a single file or directory.
/// @throws runtime_error if the file could not be queried.
file_info_t get_file_info(const std::string& path);

/// @brief Convert a size to a human readable string.
///
/// The size is scaled by 1024 until it fits, and printed with one decimal and a binary unit
/// (B, KiB, MiB, ... YiB), e.g. "0.0B", "13.0B" or "4.7MiB".
/// @param byte_size The size (number of bytes).
std::string human_readable_size(const int64_t byte_size);

/// @brief List the entries directly inside a directory (not recursive).
/// @param path The path to the directory.
/// @returns a vector of file information objects, in no particular order. Entries that are
/// neither regular files nor directories (e.g. sockets) are left out.
/// @throws runtime_error if the directory could not be read.
std::vector<file_info_t> list_directory(const std::string& path);

/// @brief Walk a directory and its subdirectories.
/// @param path The path to the directory.
/// @returns a vector of file information objects.
/// @note Directories are listed after any files that are contained within the directories.
std::vector<file_info_t> walk_directory(const std::string& path);

/// @brief Create a directory.
/// @param path The path to the directory.
/// @param mode The permission bits for the new directory (subject to the process umask).
/// @throws runtime_error if the directory could not be created.
void create_dir(const std::string& path, const mode_t mode = 0755);

/// @brief Create a directory and its parent directories.
///
/// This function will create parent directories if required (similar to mkdir -p), and if the
/// specified directory does not already exist, it is created (unlike @c create_dir, which will
/// always try to create the directory).
/// @param path The path to the directory.
/// @param mode The permission bits for every directory that is created.
/// @throws runtime_error if the directory could not be created.
void create_dir_with_parents(const std::string& path, const mode_t mode = 0755);

/// @brief Set the permission bits of a file or directory (like chmod).
/// @throws runtime_error if the permissions could not be changed.
void set_permissions(const std::string& path, const mode_t mode);

/// @returns the permission bits of a file or directory.
/// @throws runtime_error if the file could not be queried.
mode_t get_permissions(const std::string& path);

/// @brief Create a file if it does not exist, and set its modification time to now.
/// @throws runtime_error if the file could not be created or touched.
void touch(const std::string& path);

/// @brief Remove an existing file.
/// @param path The path to the file.
/// @param ignore_errors Set this to true to ignore errors related to removing files.
/// @throws runtime_error if the file could not be removed.
void remove_file(const std::string& path, const bool ignore_errors = false);

/// @brief Remove a directory and all its contents (recursively).
/// @param path The path to the dir.
/// @param ignore_errors Set this to true to ignore errors related to removing files.
/// @throws runtime_error if the dir could not be removed.
void remove_dir(const std::string& path, const bool ignore_errors = false);

/// @brief Check if a directory exists.
bool dir_exists(const std::string& path);

/// @brief Check if a regular file exists.
bool file_exists(const std::string& path);

/// @brief Move a file from an old location to a new location, replacing any existing target.
/// @throws runtime_error if the operation could not be completed.
void move(const std::string& from_path, const std::string& to_path);

/// @brief Read a file into a string.
/// @throws runtime_error if the operation could not be completed.
std::string read(const std::string& path);

/// @brief Write a string to a file, replacing any previous content.
/// @param data The data string to write.
/// @param path The path to the file.
/// @throws runtime_error if the operation could not be completed.
void write(const std::string& data, const std::string& path);

/// @brief Write a string to a file via a temporary file in the same directory.
///
/// The target file either keeps its old content or gets the complete new content, even if the
/// process is terminated half way through the write.
/// @throws runtime_error if the operation could not be completed.
void write_atomic(const std::string& data, const std::string& path);

/// @brief Append a string to a file.
/// @param data The data string to write.
/// @param path The path to the file.
/// @throws runtime_error if the operation could not be completed.
void append(const std::string& data, const std::string& path);

}  // namespace file
}  // namespace kfstore

#endif  // KFSTORE_FILE_UTILS_HPP_
