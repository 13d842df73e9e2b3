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

#include <store/memory_file_system.hpp>

#include <stdexcept>

namespace kfstore {
namespace {
const std::string ROOT_DIR = "/";
const file::mode_t OWNER_READ = 0400;
const file::mode_t OWNER_WRITE = 0200;

std::string parent_of(const std::string& path) {
  const auto parent = file::get_dir_part(path);
  return parent.empty() ? ROOT_DIR : parent;
}
}  // namespace

memory_file_system_t::memory_file_system_t() {
  m_nodes[ROOT_DIR] = node_t{true, 0755, m_clock, std::string()};
}

bool memory_file_system_t::file_exists(const std::string& path) const {
  const auto* node = find_node(path);
  return node != nullptr && !node->is_dir;
}

bool memory_file_system_t::dir_exists(const std::string& path) const {
  const auto* node = find_node(path);
  return node != nullptr && node->is_dir;
}

std::string memory_file_system_t::read(const std::string& path) const {
  const auto& node = get_node(path);
  if (node.is_dir) {
    throw std::runtime_error("Unable to read a directory: " + path);
  }
  return node.data;
}

void memory_file_system_t::write(const std::string& data, const std::string& path) {
  check_writable_parent(path);
  auto* node = find_node(path);
  if (node != nullptr && node->is_dir) {
    throw std::runtime_error("Unable to write to a directory: " + path);
  }
  ++m_clock;
  if (node == nullptr) {
    m_nodes[path] = node_t{false, 0644, m_clock, data};
  } else {
    node->data = data;
    node->modify_time = m_clock;
  }
}

void memory_file_system_t::remove_file(const std::string& path) {
  check_writable_parent(path);
  const auto it = m_nodes.find(path);
  if (it == m_nodes.end() || it->second.is_dir) {
    throw std::runtime_error("Unable to remove file: " + path);
  }
  m_nodes.erase(it);
  ++m_clock;
}

std::vector<file::file_info_t> memory_file_system_t::list_files(const std::string& path) const {
  const auto& dir = get_node(path);
  if (!dir.is_dir) {
    throw std::runtime_error("Not a directory: " + path);
  }
  if ((dir.mode & OWNER_READ) == 0) {
    throw std::runtime_error("Permission denied: " + path);
  }

  std::vector<file::file_info_t> files;
  for (const auto& item : m_nodes) {
    if (!item.second.is_dir && item.first != ROOT_DIR && parent_of(item.first) == path) {
      files.emplace_back(file::file_info_t(item.first,
                                           item.second.modify_time,
                                           static_cast<int64_t>(item.second.data.size()),
                                           false));
    }
  }
  return files;
}

void memory_file_system_t::create_dir_with_parents(const std::string& path,
                                                   const file::mode_t mode) {
  if (dir_exists(path)) {
    return;
  }

  const auto parent = parent_of(path);
  if (!dir_exists(parent)) {
    create_dir_with_parents(parent, mode);
  }

  check_writable_parent(path);
  if (find_node(path) != nullptr) {
    throw std::runtime_error("Unable to create directory (a file is in the way): " + path);
  }
  ++m_clock;
  m_nodes[path] = node_t{true, mode, m_clock, std::string()};
}

void memory_file_system_t::set_permissions(const std::string& path, const file::mode_t mode) {
  auto* node = find_node(path);
  if (node == nullptr) {
    throw std::runtime_error("Unable to change permissions of " + path);
  }
  node->mode = mode;
}

void memory_file_system_t::touch(const std::string& path) {
  check_writable_parent(path);
  auto* node = find_node(path);
  ++m_clock;
  if (node == nullptr) {
    m_nodes[path] = node_t{false, 0644, m_clock, std::string()};
  } else {
    node->modify_time = m_clock;
  }
}

file::mode_t memory_file_system_t::get_permissions(const std::string& path) const {
  return get_node(path).mode;
}

int64_t memory_file_system_t::modify_time(const std::string& path) const {
  return get_node(path).modify_time;
}

const memory_file_system_t::node_t& memory_file_system_t::get_node(const std::string& path) const {
  const auto* node = find_node(path);
  if (node == nullptr) {
    throw std::runtime_error("No such file or directory: " + path);
  }
  return *node;
}

memory_file_system_t::node_t* memory_file_system_t::find_node(const std::string& path) {
  const auto it = m_nodes.find(path);
  return it != m_nodes.end() ? &it->second : nullptr;
}

const memory_file_system_t::node_t* memory_file_system_t::find_node(
    const std::string& path) const {
  const auto it = m_nodes.find(path);
  return it != m_nodes.end() ? &it->second : nullptr;
}

void memory_file_system_t::check_writable_parent(const std::string& path) const {
  const auto parent = parent_of(path);
  const auto* dir = find_node(parent);
  if (dir == nullptr || !dir->is_dir) {
    throw std::runtime_error("No such directory: " + parent);
  }
  if ((dir->mode & OWNER_WRITE) == 0) {
    throw std::runtime_error("Permission denied: " + path);
  }
}

}  // namespace kfstore
