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

#ifndef KFSTORE_STORE_ERRORS_HPP_
#define KFSTORE_STORE_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace kfstore {
/// @brief Base class for all errors that are thrown by the key file store.
struct store_error_t : public std::runtime_error {
  store_error_t(const std::string& what) : std::runtime_error(what) {
  }
};

/// @brief The store directory can not be claimed.
///
/// Thrown during construction when the directory holds files but no ownership marker.
struct store_init_error_t : public store_error_t {
  store_init_error_t(const std::string& what) : store_error_t(what) {
  }
};

/// @brief A file system operation failed (permission denied, disk full, ...).
///
/// A missing key is never reported with this error.
struct store_io_error_t : public store_error_t {
  store_io_error_t(const std::string& what) : store_error_t(what) {
  }
};

/// @brief A key can not be used as a file name inside the store directory.
struct invalid_key_error_t : public store_error_t {
  invalid_key_error_t(const std::string& what) : store_error_t(what) {
  }
};
}  // namespace kfstore

#endif  // KFSTORE_STORE_ERRORS_HPP_
