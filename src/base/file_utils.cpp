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

#include <base/file_utils.hpp>

#include <base/debug_utils.hpp>
#include <base/env_utils.hpp>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <limits.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utime.h>

namespace kfstore {
namespace file {
namespace {
const char PATH_SEPARATOR_CHR = '/';
const auto PATH_SEPARATOR = std::string(1, PATH_SEPARATOR_CHR);

// This is a static variable that holds a strictly incrementing number used for generating unique
// temporary file names.
std::atomic_uint_fast32_t s_tmp_name_number;

std::runtime_error make_error(const std::string& what, const std::string& path) {
  const auto err = errno;
  std::ostringstream ss;
  ss << what << " " << path;
  if (err != 0) {
    ss << " (" << std::strerror(err) << ")";
  }
  return std::runtime_error(ss.str());
}

file_info_t::time_t modify_time_of(const struct stat& file_stat) {
#ifdef __APPLE__
  return static_cast<file_info_t::time_t>(file_stat.st_mtimespec.tv_sec);
#else
  return static_cast<file_info_t::time_t>(file_stat.st_mtim.tv_sec);
#endif
}

void remove_dir_internal(const std::string& path, const bool ignore_errors) {
  const auto success = (::rmdir(path.c_str()) == 0);
  if ((!success) && (!ignore_errors)) {
    throw make_error("Unable to remove dir", path);
  }
}

std::string get_current_dir() {
  char buf[PATH_MAX + 1];
  if (::getcwd(buf, sizeof(buf)) == nullptr) {
    throw make_error("Unable to get the current working directory", std::string());
  }
  return std::string(buf);
}

std::string get_home_dir_of(const std::string& user) {
  const auto* pw = ::getpwnam(user.c_str());
  if (pw == nullptr || pw->pw_dir == nullptr) {
    return std::string();
  }
  return std::string(pw->pw_dir);
}

// Collapse "." and ".." components and repeated separators of an absolute path.
std::string normalize_absolute_path(const std::string& path) {
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (start <= path.size()) {
    auto end = path.find(PATH_SEPARATOR_CHR, start);
    if (end == std::string::npos) {
      end = path.size();
    }
    const auto part = path.substr(start, end - start);
    if (part == "..") {
      if (!parts.empty()) {
        parts.pop_back();
      }
    } else if (!part.empty() && part != ".") {
      parts.emplace_back(part);
    }
    start = end + 1;
  }

  std::string result;
  for (const auto& part : parts) {
    result += PATH_SEPARATOR + part;
  }
  return result.empty() ? PATH_SEPARATOR : result;
}

void write_with_mode(const std::string& data, const std::string& path, const char* mode) {
  auto* f = std::fopen(path.c_str(), mode);
  if (f == nullptr) {
    throw make_error("Unable to open the file", path);
  }

  // Write the data to the file.
  const auto file_size = data.size();
  auto bytes_left = file_size;
  while ((bytes_left != 0u) && !std::ferror(f)) {
    const auto* ptr = &data[file_size - bytes_left];
    const auto bytes_written = std::fwrite(ptr, 1, bytes_left, f);
    bytes_left -= bytes_written;
  }

  // Close the file. A failed close (e.g. a full disk when flushing) is a failed write.
  const auto close_failed = (std::fclose(f) != 0);

  if ((bytes_left != 0u) || close_failed) {
    throw make_error("Unable to write the file", path);
  }
}
}  // namespace

tmp_file_t::tmp_file_t(const std::string& dir, const std::string& extension) {
  // Get unique identifiers for this file.
  const auto pid = static_cast<int>(::getpid());
  const auto number = ++s_tmp_name_number;

  // Generate a file name from the unique identifiers. The name is hidden (starts with a period),
  // so it never collides with a store key.
  std::ostringstream ss;
  ss << ".kfstore" << pid << "_" << number;
  std::string file_name = ss.str();

  // Concatenate base dir, file name and extension into the full path.
  m_path = append_path(dir, file_name + extension);
}

tmp_file_t::~tmp_file_t() {
  try {
    if (file_exists(m_path)) {
      remove_file(m_path);
    } else if (dir_exists(m_path)) {
      remove_dir(m_path);
    }
  } catch (const std::exception& e) {
    debug::log(debug::ERROR) << e.what();
  }
}

file_info_t::file_info_t(const std::string& path,
                         const file_info_t::time_t modify_time,
                         const int64_t size,
                         const bool is_dir)
    : m_path(path), m_modify_time(modify_time), m_size(size), m_is_dir(is_dir) {
}

std::string append_path(const std::string& path, const std::string& append) {
  if (path.empty() || append.empty()) {
    return path + append;
  }
  return path + PATH_SEPARATOR + append;
}

std::string append_path(const std::string& path, const char* append) {
  return append_path(path, std::string(append));
}

std::string get_file_part(const std::string& path) {
  const auto pos = path.rfind(PATH_SEPARATOR_CHR);
  return (pos != std::string::npos) ? path.substr(pos + 1) : path;
}

std::string get_dir_part(const std::string& path) {
  const auto pos = path.rfind(PATH_SEPARATOR_CHR);
  return (pos != std::string::npos) ? path.substr(0, pos) : std::string();
}

std::string get_temp_dir() {
  // 1. Try $XDG_RUNTIME_DIR. See:
  //    https://specifications.freedesktop.org/basedir-spec/basedir-spec-latest.html
  const env_var_t xdg_runtime_dir("XDG_RUNTIME_DIR");
  if (xdg_runtime_dir && dir_exists(xdg_runtime_dir.as_string())) {
    return xdg_runtime_dir.as_string();
  }

  // 2. Try $TMPDIR. See:
  //    https://pubs.opengroup.org/onlinepubs/9699919799/basedefs/V1_chap08.html#tag_08_03
  const env_var_t tmpdir("TMPDIR");
  if (tmpdir && dir_exists(tmpdir.as_string())) {
    return tmpdir.as_string();
  }

  // 3. Fall back to /tmp. See:
  //    http://refspecs.linuxfoundation.org/FHS_3.0/fhs/ch03s18.html
  return std::string("/tmp");
}

std::string get_user_home_dir() {
  const env_var_t home("HOME");
  if (home) {
    return home.as_string();
  }

  // No $HOME (e.g. when running as a service): ask the password database.
  const auto* pw = ::getpwuid(::getuid());
  return (pw != nullptr && pw->pw_dir != nullptr) ? std::string(pw->pw_dir) : std::string();
}

std::string expand_user(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }

  const auto sep_pos = path.find(PATH_SEPARATOR_CHR);
  const auto user_len = (sep_pos == std::string::npos) ? std::string::npos : sep_pos - 1;
  const auto user = path.substr(1, user_len);
  const auto home = user.empty() ? get_user_home_dir() : get_home_dir_of(user);
  if (home.empty()) {
    return path;
  }

  return (sep_pos == std::string::npos) ? home : (home + path.substr(sep_pos));
}

bool is_absolute_path(const std::string& path) {
  return (path.size() >= 1) && (path[0] == PATH_SEPARATOR_CHR);
}

std::string absolute_path(const std::string& path) {
  const auto full_path = is_absolute_path(path) ? path : append_path(get_current_dir(), path);
  return normalize_absolute_path(full_path);
}

file_info_t get_file_info(const std::string& path) {
  struct stat file_stat;
  if (::stat(path.c_str(), &file_stat) != 0) {
    throw make_error("Unable to get file information for", path);
  }
  const bool is_dir = S_ISDIR(file_stat.st_mode);
  const auto size = S_ISREG(file_stat.st_mode) ? static_cast<int64_t>(file_stat.st_size) : 0;
  return file_info_t(path, modify_time_of(file_stat), size, is_dir);
}

std::string human_readable_size(const int64_t byte_size) {
  static const char* SUFFIX[9] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB", "ZiB", "YiB"};
  static const int MAX_SUFFIX_IDX = (sizeof(SUFFIX) / sizeof(SUFFIX[0])) - 1;

  double scaled_size = static_cast<double>(byte_size);
  int suffix_idx = 0;
  for (; (scaled_size >= 1024.0 || scaled_size <= -1024.0) && suffix_idx < MAX_SUFFIX_IDX;
       ++suffix_idx) {
    scaled_size /= 1024.0;
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%s", scaled_size, SUFFIX[suffix_idx]);
  return std::string(buf);
}

std::vector<file_info_t> list_directory(const std::string& path) {
  std::vector<file_info_t> files;

  auto* dir = ::opendir(path.c_str());
  if (dir == nullptr) {
    throw make_error("Unable to list the directory", path);
  }

  auto* entity = ::readdir(dir);
  while (entity != nullptr) {
    const auto name = std::string(entity->d_name);
    if ((name != ".") && (name != "..")) {
      const auto file_path = append_path(path, name);
      struct stat file_stat;
      if (::stat(file_path.c_str(), &file_stat) == 0) {
        if (S_ISDIR(file_stat.st_mode)) {
          files.emplace_back(file_info_t(file_path, modify_time_of(file_stat), 0, true));
        } else if (S_ISREG(file_stat.st_mode)) {
          files.emplace_back(file_info_t(file_path,
                                         modify_time_of(file_stat),
                                         static_cast<int64_t>(file_stat.st_size),
                                         false));
        }
      }
    }
    entity = ::readdir(dir);
  }

  ::closedir(dir);

  return files;
}

std::vector<file_info_t> walk_directory(const std::string& path) {
  std::vector<file_info_t> files;
  for (const auto& entry : list_directory(path)) {
    if (entry.is_dir()) {
      auto subdir_files = walk_directory(entry.path());
      files.insert(files.end(), subdir_files.begin(), subdir_files.end());
    }
    files.emplace_back(entry);
  }
  return files;
}

void create_dir(const std::string& path, const mode_t mode) {
  if (::mkdir(path.c_str(), static_cast< ::mode_t>(mode)) != 0) {
    throw make_error("Unable to create directory", path);
  }
}

void create_dir_with_parents(const std::string& path, const mode_t mode) {
  // Recursively create parent directories if necessary.
  const auto parent = get_dir_part(path);
  if (parent.size() < path.size() && !parent.empty() && !dir_exists(parent)) {
    create_dir_with_parents(parent, mode);
  }

  // Create the requested directory unless it already exists.
  if (!path.empty() && !dir_exists(path)) {
    create_dir(path, mode);
  }
}

void set_permissions(const std::string& path, const mode_t mode) {
  if (::chmod(path.c_str(), static_cast< ::mode_t>(mode)) != 0) {
    throw make_error("Unable to change permissions of", path);
  }
}

mode_t get_permissions(const std::string& path) {
  struct stat file_stat;
  if (::stat(path.c_str(), &file_stat) != 0) {
    throw make_error("Unable to get permissions of", path);
  }
  return static_cast<mode_t>(file_stat.st_mode & 07777);
}

void touch(const std::string& path) {
  const auto fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0666);
  if (fd < 0) {
    throw make_error("Unable to create the file", path);
  }
  ::close(fd);

  if (::utime(path.c_str(), nullptr) != 0) {
    throw make_error("Unable to update the modification time of", path);
  }
}

void remove_file(const std::string& path, const bool ignore_errors) {
  const auto success = (::unlink(path.c_str()) == 0);
  if ((!success) && (!ignore_errors)) {
    throw make_error("Unable to remove file", path);
  }
}

void remove_dir(const std::string& path, const bool ignore_errors) {
  const auto files = walk_directory(path);
  for (const auto& file : files) {
    if (file.is_dir()) {
      remove_dir_internal(file.path(), ignore_errors);
    } else {
      remove_file(file.path(), ignore_errors);
    }
  }
  remove_dir_internal(path, ignore_errors);
}

bool dir_exists(const std::string& path) {
  struct stat buffer;
  const auto success = (::stat(path.c_str(), &buffer) == 0);
  return success && S_ISDIR(buffer.st_mode);
}

bool file_exists(const std::string& path) {
  struct stat buffer;
  const auto success = (::stat(path.c_str(), &buffer) == 0);
  return success && S_ISREG(buffer.st_mode);
}

void move(const std::string& from_path, const std::string& to_path) {
  // rename() replaces the target atomically on POSIX systems.
  if (std::rename(from_path.c_str(), to_path.c_str()) != 0) {
    throw make_error("Unable to move file to", to_path);
  }
}

std::string read(const std::string& path) {
  auto* f = std::fopen(path.c_str(), "rb");
  if (f == nullptr) {
    throw make_error("Unable to open the file", path);
  }

  // Get file size.
  std::fseek(f, 0, SEEK_END);
  const auto file_size = static_cast<size_t>(std::ftell(f));
  std::fseek(f, 0, SEEK_SET);

  // Read the data into a string.
  std::string str;
  str.resize(static_cast<std::string::size_type>(file_size));
  auto bytes_left = file_size;
  while ((bytes_left != 0u) && !std::feof(f) && !std::ferror(f)) {
    auto* ptr = &str[file_size - bytes_left];
    const auto bytes_read = std::fread(ptr, 1, bytes_left, f);
    bytes_left -= bytes_read;
  }

  // Close the file.
  std::fclose(f);

  if (bytes_left != 0u) {
    throw make_error("Unable to read the file", path);
  }

  return str;
}

void write(const std::string& data, const std::string& path) {
  write_with_mode(data, path, "wb");
}

void write_atomic(const std::string& data, const std::string& path) {
  // Save to a temporary file first and once the write operation has succeeded rename it to the
  // target file. The temporary file is removed by tmp_file_t if anything goes wrong.
  auto dir = get_dir_part(path);
  if (dir.empty() && is_absolute_path(path)) {
    dir = PATH_SEPARATOR;
  }
  tmp_file_t tmp_file(dir, ".tmp");
  write(data, tmp_file.path());
  move(tmp_file.path(), path);
}

void append(const std::string& data, const std::string& path) {
  if (path.empty()) {
    throw std::runtime_error("No file path given.");
  }
  write_with_mode(data, path, "ab");
}

}  // namespace file
}  // namespace kfstore
