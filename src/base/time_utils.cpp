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

#include <base/time_utils.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

#include <sys/time.h>
#include <sys/types.h>

namespace kfstore {
namespace time {

seconds_t seconds_since_epoch() {
  struct timeval now;
  if (::gettimeofday(&now, nullptr) == 0) {
    return static_cast<seconds_t>(now.tv_sec);
  }
  throw std::runtime_error("Could not get system time.");
}

std::string to_string(const seconds_t t) {
  return std::to_string(static_cast<long long>(t));
}

bool parse(const std::string& str, seconds_t& t) {
  const char* begin = str.c_str();
  char* end = nullptr;
  errno = 0;
  const auto value = std::strtoll(begin, &end, 10);
  if ((end == begin) || (errno == ERANGE)) {
    return false;
  }

  // Only trailing white space may follow the number (strtoll already skipped leading space).
  for (; *end != '\0'; ++end) {
    if (std::isspace(static_cast<unsigned char>(*end)) == 0) {
      return false;
    }
  }

  // Embedded NUL characters would have stopped the scan above early.
  if (static_cast<std::string::size_type>(end - begin) != str.size()) {
    return false;
  }

  t = static_cast<seconds_t>(value);
  return true;
}

}  // namespace time
}  // namespace kfstore
