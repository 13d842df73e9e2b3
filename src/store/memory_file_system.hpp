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

#ifndef KFSTORE_MEMORY_FILE_SYSTEM_HPP_
#define KFSTORE_MEMORY_FILE_SYSTEM_HPP_

#include <store/file_system.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace kfstore {

/// @brief A volatile file system that lives in memory.
///
/// The root directory ("/") always exists. Directory permissions are honored in a simplified way:
/// creating, writing, touching or removing a file requires the owner write bit (0200) on the
/// parent directory, and listing a directory requires the owner read bit (0400). File
/// modification times come from a counter that is incremented by every change, so a later change
/// always has a larger time.
class memory_file_system_t : public file_system_t {
public:
  memory_file_system_t();

  // Implementation of the file_system_t interface.
  bool file_exists(const std::string& path) const override;
  bool dir_exists(const std::string& path) const override;
  std::string read(const std::string& path) const override;
  void write(const std::string& data, const std::string& path) override;
  void remove_file(const std::string& path) override;
  std::vector<file::file_info_t> list_files(const std::string& path) const override;
  void create_dir_with_parents(const std::string& path, const file::mode_t mode) override;
  void set_permissions(const std::string& path, const file::mode_t mode) override;
  void touch(const std::string& path) override;

  /// @returns the permission bits of a file or directory.
  /// @throws runtime_error if there is no such file or directory.
  file::mode_t get_permissions(const std::string& path) const;

  /// @returns the modification time of a file or directory.
  /// @throws runtime_error if there is no such file or directory.
  int64_t modify_time(const std::string& path) const;

private:
  struct node_t {
    bool is_dir;
    file::mode_t mode;
    int64_t modify_time;
    std::string data;
  };

  const node_t& get_node(const std::string& path) const;
  node_t* find_node(const std::string& path);
  const node_t* find_node(const std::string& path) const;
  void check_writable_parent(const std::string& path) const;

  std::map<std::string, node_t> m_nodes;
  int64_t m_clock = 0;
};

}  // namespace kfstore

#endif  // KFSTORE_MEMORY_FILE_SYSTEM_HPP_
