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

#ifndef KFSTORE_LOCAL_FILE_SYSTEM_HPP_
#define KFSTORE_LOCAL_FILE_SYSTEM_HPP_

#include <store/file_system.hpp>

namespace kfstore {

/// @brief The real, local file system.
///
/// Writes go through a temporary file in the target directory that is renamed onto the target, so
/// a file always holds either its old or its new content.
class local_file_system_t : public file_system_t {
public:
  local_file_system_t();

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
};

}  // namespace kfstore

#endif  // KFSTORE_LOCAL_FILE_SYSTEM_HPP_
