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

#include <base/env_utils.hpp>

#include <cstdlib>

namespace kfstore {
namespace {
const char* get_env_ptr(const std::string& env_var) {
  return ::getenv(env_var.c_str());
}

void restore(const std::string& name, const env_var_t& old_env_var) {
  if (old_env_var) {
    set_env(name, old_env_var.as_string());
  } else {
    unset_env(name);
  }
}
}  // namespace

env_var_t::env_var_t(const std::string& name) {
  const auto* env = get_env_ptr(name);
  m_defined = (env != nullptr);
  if (m_defined) {
    m_value = std::string(env);
  }
}

int64_t env_var_t::as_int64() const {
  return static_cast<int64_t>(std::stoll(m_value));
}

scoped_set_env_t::scoped_set_env_t(const std::string& name, const std::string& value)
    : m_name(name), m_old_env_var(name) {
  set_env(name, value);
}

scoped_set_env_t::~scoped_set_env_t() {
  restore(m_name, m_old_env_var);
}

scoped_unset_env_t::scoped_unset_env_t(const std::string& name)
    : m_name(name), m_old_env_var(name) {
  unset_env(name);
}

scoped_unset_env_t::~scoped_unset_env_t() {
  restore(m_name, m_old_env_var);
}

void set_env(const std::string& env_var, const std::string& value) {
  (void)::setenv(env_var.c_str(), value.c_str(), 1);
}

void unset_env(const std::string& env_var) {
  (void)::unsetenv(env_var.c_str());
}

}  // namespace kfstore
