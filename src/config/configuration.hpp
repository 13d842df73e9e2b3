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

#ifndef KFSTORE_CONFIGURATION_HPP_
#define KFSTORE_CONFIGURATION_HPP_

#include <cstdint>
#include <string>

namespace kfstore {
namespace config {

/// @brief The settings that a store is constructed from.
struct settings_t {
  /// The store directory, as given by the user. It may be relative and may start with "~".
  std::string file_dir;

  /// The log level (see debug::log_level_t), or -1 to disable logging.
  int32_t debug = -1;

  /// The log file (empty string for stdout).
  std::string log_file;
};

/// @brief Read settings from the configuration file and the environment.
///
/// The configuration file is read first (if it exists), and KFSTORE_* environment variables
/// override any values from the file. Nothing is cached: every call reads the file and the
/// environment anew.
/// @throws runtime_error if the configuration file could not be read or parsed.
settings_t read_settings();

/// @brief Parse settings from a JSON document.
/// @param json The JSON document (an object).
/// @param[in,out] settings Fields that are present in the document are overwritten.
/// @throws runtime_error if the document is not valid JSON.
void parse_settings(const std::string& json, settings_t& settings);

/// @brief Initialize the process wide configuration.
///
/// Reads the settings (see read_settings()) and applies the logging settings to the debug log.
/// Only the first call has any effect.
void init();

/// @returns the process wide settings (valid after init()).
const settings_t& settings();

/// @returns the store directory.
const std::string& file_dir();

/// @returns the debug level (-1 for no debugging).
int32_t debug();

/// @returns the log file (empty string for stdout).
const std::string& log_file();

/// @returns the configuration file that was (or would have been) read by init().
const std::string& config_file();

}  // namespace config
}  // namespace kfstore

#endif  // KFSTORE_CONFIGURATION_HPP_
