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

#ifndef KFSTORE_TIME_SOURCE_HPP_
#define KFSTORE_TIME_SOURCE_HPP_

#include <base/time_utils.hpp>

namespace kfstore {

/// @brief A source of the current time, used for expiry checks.
class time_source_t {
public:
  virtual ~time_source_t();

  /// @returns the current time in seconds since the Unix epoch.
  virtual time::seconds_t now() const = 0;

protected:
  time_source_t();
};

/// @brief The system wall clock.
class system_time_source_t : public time_source_t {
public:
  time::seconds_t now() const override;
};

}  // namespace kfstore

#endif  // KFSTORE_TIME_SOURCE_HPP_
