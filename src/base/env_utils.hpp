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

#ifndef KFSTORE_ENV_UTILS_HPP_
#define KFSTORE_ENV_UTILS_HPP_

#include <cstdint>
#include <string>

namespace kfstore {
/// @brief A snapshot of an environment variable.
///
/// The value is read once, when the object is constructed.
class env_var_t {
public:
  /// @param name The name of the environment variable.
  explicit env_var_t(const std::string& name);

  /// @returns true if the environment variable was defined.
  explicit operator bool() const {
    return m_defined;
  }

  /// @returns the raw value (empty if the variable is undefined).
  const std::string& as_string() const {
    return m_value;
  }

  /// @returns the value as an integer.
  /// @throws std::invalid_argument or std::out_of_range if the value is not an integer.
  int64_t as_int64() const;

private:
  std::string m_value;
  bool m_defined = false;
};

/// @brief Set an environment variable for the life time of the object.
///
/// The previous state of the variable (including "undefined") is restored by the destructor.
class scoped_set_env_t {
public:
  scoped_set_env_t(const std::string& name, const std::string& value);
  ~scoped_set_env_t();

  scoped_set_env_t(const scoped_set_env_t&) = delete;
  scoped_set_env_t& operator=(const scoped_set_env_t&) = delete;

private:
  std::string m_name;
  env_var_t m_old_env_var;
};

/// @brief Unset an environment variable for the life time of the object.
class scoped_unset_env_t {
public:
  explicit scoped_unset_env_t(const std::string& name);
  ~scoped_unset_env_t();

  scoped_unset_env_t(const scoped_unset_env_t&) = delete;
  scoped_unset_env_t& operator=(const scoped_unset_env_t&) = delete;

private:
  std::string m_name;
  env_var_t m_old_env_var;
};

/// @brief Set the named environment variable for this process.
void set_env(const std::string& env_var, const std::string& value);

/// @brief Unset the named environment variable for this process.
void unset_env(const std::string& env_var);

}  // namespace kfstore

#endif  // KFSTORE_ENV_UTILS_HPP_
