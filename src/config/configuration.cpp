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

#include <config/configuration.hpp>

#include <base/debug_utils.hpp>
#include <base/env_utils.hpp>
#include <base/file_utils.hpp>

#include <cjson/cJSON.h>

#include <sstream>
#include <stdexcept>

namespace kfstore {
namespace {
// Various constants.
const std::string DEFAULT_FILE_DIR = "~/.kfstore";
const std::string CONFIGURATION_FILE_NAME = ".kfstore.json";

// The configuration file for this configuration.
std::string s_config_file;

// Configuration options.
config::settings_t s_settings;

std::string get_config_file() {
  // Is the environment variable KFSTORE_CONFIG_FILE defined?
  {
    const env_var_t file_env("KFSTORE_CONFIG_FILE");
    if (file_env) {
      return file_env.as_string();
    }
  }

  // Use the user home directory if possible.
  const auto home = file::get_user_home_dir();
  if (!home.empty()) {
    return file::append_path(home, CONFIGURATION_FILE_NAME);
  }

  // Without a home directory there is no configuration file, only the environment.
  return std::string();
}

void load_from_file(const std::string& file_name, config::settings_t& settings) {
  if (file_name.empty() || !file::file_exists(file_name)) {
    // Nothing to do.
    return;
  }
  config::parse_settings(file::read(file_name), settings);
}

void load_from_env(config::settings_t& settings) {
  {
    const env_var_t env("KFSTORE_FILE_DIR");
    if (env) {
      settings.file_dir = env.as_string();
    }
  }

  {
    const env_var_t env("KFSTORE_DEBUG");
    if (env) {
      try {
        settings.debug = static_cast<int32_t>(env.as_int64());
      } catch (const std::logic_error&) {
        debug::log(debug::WARNING) << "Ignoring invalid KFSTORE_DEBUG value: " << env.as_string();
      }
    }
  }

  {
    const env_var_t env("KFSTORE_LOG_FILE");
    if (env) {
      settings.log_file = env.as_string();
    }
  }
}
}  // namespace

namespace config {
void parse_settings(const std::string& json, settings_t& settings) {
  // Parse the JSON data.
  auto* root = cJSON_Parse(json.c_str());
  if (root == nullptr) {
    std::ostringstream ss;
    ss << "Configuration file JSON parse error before:\n";
    const auto* json_error = cJSON_GetErrorPtr();
    if (json_error != nullptr) {
      ss << json_error;
    } else {
      ss << "(N/A)";
    }
    throw std::runtime_error(ss.str());
  }

  {
    const auto* node = cJSON_GetObjectItemCaseSensitive(root, "file_dir");
    if (cJSON_IsString(node) && node->valuestring != nullptr) {
      settings.file_dir = std::string(node->valuestring);
    }
  }

  {
    const auto* node = cJSON_GetObjectItemCaseSensitive(root, "debug");
    if (cJSON_IsNumber(node)) {
      settings.debug = static_cast<int32_t>(node->valueint);
    }
  }

  {
    const auto* node = cJSON_GetObjectItemCaseSensitive(root, "log_file");
    if (cJSON_IsString(node) && node->valuestring != nullptr) {
      settings.log_file = std::string(node->valuestring);
    }
  }

  cJSON_Delete(root);
}

settings_t read_settings() {
  settings_t settings;
  settings.file_dir = DEFAULT_FILE_DIR;

  // Note: The file is loaded before the environment, so that the environment overrides the
  // configuration file.
  load_from_file(get_config_file(), settings);
  load_from_env(settings);

  return settings;
}

void init() {
  // Guard: Only initialize once.
  static bool s_initialized = false;
  if (s_initialized) {
    return;
  }

  s_config_file = get_config_file();
  s_settings = read_settings();
  s_initialized = true;

  debug::set_log_level(s_settings.debug);
  debug::set_log_file(s_settings.log_file);
  debug::log(debug::DEBUG) << "Configuration: file_dir=" << s_settings.file_dir
                           << " debug=" << s_settings.debug << " log_file=" << s_settings.log_file
                           << " (from " << s_config_file << ")";
}

const settings_t& settings() {
  return s_settings;
}

const std::string& file_dir() {
  return s_settings.file_dir;
}

int32_t debug() {
  return s_settings.debug;
}

const std::string& log_file() {
  return s_settings.log_file;
}

const std::string& config_file() {
  return s_config_file;
}

}  // namespace config
}  // namespace kfstore
