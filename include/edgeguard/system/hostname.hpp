// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cerrno>
#include <climits>
#include <cstring>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace edgeguard
{
namespace system
{

/// \brief Name of the local host as reported by gethostname(2).
/// \throws std::runtime_error if the OS call fails
inline std::string localHostname()
{
#ifdef HOST_NAME_MAX
  char buf[HOST_NAME_MAX + 1] = {0};
#else
  char buf[256] = {0};
#endif
  if (::gethostname(buf, sizeof(buf) - 1) != 0)
  {
    throw std::runtime_error(std::string("Error getting the hostname from the OS: ") +
                             std::strerror(errno));
  }
  return std::string(buf);
}

} // namespace system
} // namespace edgeguard
