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

#ifndef KFSTORE_DEBUG_UTILS_HPP_
#define KFSTORE_DEBUG_UTILS_HPP_

#include <sstream>
#include <string>

namespace kfstore {
namespace debug {
/// @brief Store log levels, from most to least verbose.
enum log_level_t { DEBUG = 1, INFO = 2, WARNING = 3, ERROR = 4, FATAL = 5, NONE = 6 };

/// @brief Set the process wide log level.
/// @param level An integer in the range [DEBUG, FATAL]. Any other value (e.g. -1, which is what
/// the configuration uses for "no logging") disables logging.
void set_log_level(const int level);

/// @returns the current log level.
///
/// Unless set_log_level() has been called, the level is taken from the KFSTORE_DEBUG environment
/// variable the first time this function is called.
log_level_t get_log_level();

/// @brief Direct log output to a file.
/// @param file Path to a log file, or an empty string for stdout.
/// @note Messages are appended to the file. If the file can not be written, the message goes to
/// stdout instead.
void set_log_file(const std::string& file);

/// @returns the upper case name of a log level (e.g. "WARNING").
std::string to_string(const log_level_t level);

/// @brief A log stream object.
///
/// The message is assembled with the stream operator and emitted as a single line when the object
/// goes out of scope:
/// @code
/// debug::log(debug::INFO) << "Claimed " << dir;
/// @endcode
class log {
public:
  log(const log_level_t level);
  ~log();

  template <typename T>
  log& operator<<(const T& message) {
    m_stream << message;
    return *this;
  }

private:
  const log_level_t m_level;
  std::ostringstream m_stream;
};
}  // namespace debug
}  // namespace kfstore

#endif  // KFSTORE_DEBUG_UTILS_HPP_
