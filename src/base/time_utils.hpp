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

#ifndef KFSTORE_TIME_UTILS_HPP_
#define KFSTORE_TIME_UTILS_HPP_

#include <cstdint>
#include <string>

namespace kfstore {
namespace time {
/// @brief Time in seconds since the Unix epoch (00:00:00 UTC on 1 January 1970).
///
/// 64 bits wide, so expiry times beyond 2038 are fine.
using seconds_t = int64_t;

/// @returns the current wall clock time in whole seconds since the Unix epoch.
/// @throws runtime_error if the system time could not be read.
seconds_t seconds_since_epoch();

/// @brief Format a time stamp as a decimal string (e.g. "1700000000").
std::string to_string(const seconds_t t);

/// @brief Parse a decimal time stamp.
///
/// Leading and trailing white space is accepted, anything else that is not part of the number is
/// not.
/// @param str The string to parse.
/// @param[out] t The parsed time stamp.
/// @returns true if the string held a valid time stamp.
bool parse(const std::string& str, seconds_t& t);

}  // namespace time
}  // namespace kfstore

#endif  // KFSTORE_TIME_UTILS_HPP_
