//--------------------------------------------------------------------------------------------------
// Copyright (c) 2019 Marcus Geelnard
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

#include <base/debug_utils.hpp>

#include <base/env_utils.hpp>
#include <base/file_utils.hpp>

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

#include <sys/types.h>
#include <unistd.h>

namespace kfstore {
namespace debug {
namespace {
// Negative means "not yet resolved from the environment".
std::atomic_int s_log_level(-1);

std::mutex s_log_file_mutex;
std::string s_log_file;

int to_valid_level(const int level) {
  if ((level < static_cast<int>(DEBUG)) || (level > static_cast<int>(FATAL))) {
    return static_cast<int>(NONE);
  }
  return level;
}

int level_from_env() {
  const env_var_t env("KFSTORE_DEBUG");
  if (!env) {
    return static_cast<int>(NONE);
  }
  try {
    return to_valid_level(static_cast<int>(env.as_int64()));
  } catch (const std::logic_error&) {
    // std::stoll throws invalid_argument or out_of_range, both of which mean "not a level".
    return static_cast<int>(NONE);
  }
}

std::string pad_string(const std::string& str, const size_t width) {
  return (str.size() < width) ? (str + std::string(width - str.size(), ' ')) : str;
}

std::string get_log_file() {
  std::lock_guard<std::mutex> guard(s_log_file_mutex);
  return s_log_file;
}
}  // namespace

void set_log_level(const int level) {
  s_log_level = to_valid_level(level);
}

log_level_t get_log_level() {
  int level = s_log_level;
  if (level < 0) {
    level = level_from_env();
    s_log_level = level;
  }
  return static_cast<log_level_t>(level);
}

void set_log_file(const std::string& file) {
  std::lock_guard<std::mutex> guard(s_log_file_mutex);
  s_log_file = file;
}

std::string to_string(const log_level_t level) {
  switch (level) {
    case DEBUG:
      return "DEBUG";
    case INFO:
      return "INFO";
    case WARNING:
      return "WARNING";
    case ERROR:
      return "ERROR";
    case FATAL:
      return "FATAL";
    case NONE:
      return "NONE";
    default:
      return "?";
  }
}

log::log(const log_level_t level) : m_level(level) {
}

log::~log() {
  if (m_level < get_log_level()) {
    return;
  }

  std::ostringstream line;
  const auto level_str = std::string("(") + to_string(m_level) + ")";
  line << "kfstore[" << static_cast<int>(getpid()) << "] " << pad_string(level_str, 9) << " "
       << m_stream.str() << "\n";

  const auto log_file = get_log_file();
  if (!log_file.empty()) {
    try {
      file::append(line.str(), log_file);
      return;
    } catch (const std::exception&) {
      // Fall through to stdout.
    }
  }
  std::cout << line.str() << std::flush;
}
}  // namespace debug
}  // namespace kfstore
