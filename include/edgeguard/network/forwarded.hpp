// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <edgeguard/util/strings.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace edgeguard
{
namespace network
{
namespace forwarded
{

/// \brief Drop a trailing ":port" and IPv6 brackets from a socket address.
///
/// "10.0.0.1:8080" -> "10.0.0.1", "[::1]:443" -> "::1", "[::1]" -> "::1".
/// A bare IPv6 literal (more than one colon, no brackets) is returned as is.
inline std::string stripPort(const std::string &address)
{
  std::string addr = util::trim(address);
  if (!addr.empty() && addr.front() == '[')
  {
    auto close = addr.find(']');
    if (close == std::string::npos)
    {
      return addr;
    }
    return addr.substr(1, close - 1);
  }

  auto colon = addr.find(':');
  if (colon != std::string::npos && addr.find(':', colon + 1) == std::string::npos)
  {
    return addr.substr(0, colon);
  }
  return addr;
}

/// \brief Node of the first "for=" parameter in an RFC 7239 Forwarded value.
///
/// Elements are separated by ',' and parameters within an element by ';'.
/// The parameter name is matched case-insensitively; quotes, brackets and
/// any port are removed from the value.
inline std::optional<std::string> firstForwardedFor(const std::string &headerValue)
{
  std::size_t elemStart = 0;
  while (elemStart <= headerValue.size())
  {
    auto elemEnd = headerValue.find(',', elemStart);
    std::string element = headerValue.substr(
      elemStart, elemEnd == std::string::npos ? std::string::npos : elemEnd - elemStart);

    std::size_t pairStart = 0;
    while (pairStart <= element.size())
    {
      auto pairEnd = element.find(';', pairStart);
      std::string pair = element.substr(
        pairStart, pairEnd == std::string::npos ? std::string::npos : pairEnd - pairStart);

      auto kv = util::splitOnce(pair, '=');
      if (kv)
      {
        std::string name = util::trim(kv->first);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "for")
        {
          std::string value = util::trim(kv->second);
          if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
          {
            value = value.substr(1, value.size() - 2);
          }
          value = stripPort(value);
          if (!value.empty())
          {
            return value;
          }
        }
      }

      if (pairEnd == std::string::npos)
      {
        break;
      }
      pairStart = pairEnd + 1;
    }

    if (elemEnd == std::string::npos)
    {
      break;
    }
    elemStart = elemEnd + 1;
  }
  return std::nullopt;
}

/// \brief First (client-most) entry of an X-Forwarded-For list.
inline std::optional<std::string> firstXForwardedFor(const std::string &headerValue)
{
  auto comma = headerValue.find(',');
  std::string first = util::trim(headerValue.substr(0, comma));
  if (first.empty())
  {
    return std::nullopt;
  }
  return first;
}

/// \brief Address the forwarding headers name as the originating client.
///
/// Precedence: Forwarded "for=", then X-Forwarded-For, then \p peer.
inline std::optional<std::string> resolve(const std::optional<std::string> &forwardedHeader,
                                          const std::optional<std::string> &xForwardedFor,
                                          const std::optional<std::string> &peer)
{
  if (forwardedHeader)
  {
    if (auto addr = firstForwardedFor(*forwardedHeader))
    {
      return addr;
    }
  }
  if (xForwardedFor)
  {
    if (auto addr = firstXForwardedFor(*xForwardedFor))
    {
      return addr;
    }
  }
  return peer;
}

} // namespace forwarded
} // namespace network
} // namespace edgeguard
