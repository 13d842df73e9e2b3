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

#include <store/local_file_system.hpp>

namespace kfstore {

local_file_system_t::local_file_system_t() {
}

bool local_file_system_t::file_exists(const std::string& path) const {
  return file::file_exists(path);
}

bool local_file_system_t::dir_exists(const std::string& path) const {
  return file::dir_exists(path);
}

std::string local_file_system_t::read(const std::string& path) const {
  return file::read(path);
}

void local_file_system_t::write(const std::string& data, const std::string& path) {
  file::write_atomic(data, path);
}

void local_file_system_t::remove_file(const std::string& path) {
  file::remove_file(path);
}

std::vector<file::file_info_t> local_file_system_t::list_files(const std::string& path) const {
  std::vector<file::file_info_t> files;
  for (const auto& entry : file::list_directory(path)) {
    if (!entry.is_dir()) {
      files.emplace_back(entry);
    }
  }
  return files;
}

void local_file_system_t::create_dir_with_parents(const std::string& path,
                                                  const file::mode_t mode) {
  file::create_dir_with_parents(path, mode);
}

void local_file_system_t::set_permissions(const std::string& path, const file::mode_t mode) {
  file::set_permissions(path, mode);
}

void local_file_system_t::touch(const std::string& path) {
  file::touch(path);
}

}  // namespace kfstore
