// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <edgeguard/network/ip_utils.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace edgeguard
{

/// \brief Reasons a request or token is refused.
enum class ErrorKind
{
  None,
  MissingPeerAddress,
  MalformedPeerAddress,
  UntrustedProxy,
  MalformedToken,
  MalformedTokenBody,
  MalformedTokenClaims
};

inline const char *toString(ErrorKind kind)
{
  switch (kind)
  {
  case ErrorKind::None:
    return "None";
  case ErrorKind::MissingPeerAddress:
    return "MissingPeerAddress";
  case ErrorKind::MalformedPeerAddress:
    return "MalformedPeerAddress";
  case ErrorKind::UntrustedProxy:
    return "UntrustedProxy";
  case ErrorKind::MalformedToken:
    return "MalformedToken";
  case ErrorKind::MalformedTokenBody:
    return "MalformedTokenBody";
  case ErrorKind::MalformedTokenClaims:
    return "MalformedTokenClaims";
  }
  return "Unknown";
}

inline std::ostream &operator<<(std::ostream &os, ErrorKind kind) { return os << toString(kind); }

/// \brief HTTP status an enclosing server answers with for \p kind.
/// A token without its separators is an authentication failure (401);
/// everything else is a bad request (400).
inline int toHttpStatus(ErrorKind kind)
{
  switch (kind)
  {
  case ErrorKind::None:
    return 200;
  case ErrorKind::MalformedToken:
    return 401;
  default:
    return 400;
  }
}

/// \brief Outcome of client IP resolution.
struct ResolveResult
{
  bool ok{false};
  std::optional<network::IpAddress> ip;
  ErrorKind code{ErrorKind::None};
  std::string message;

  static ResolveResult success(const network::IpAddress &addr)
  {
    return {true, addr, ErrorKind::None, ""};
  }

  static ResolveResult failure(ErrorKind c, const std::string &m)
  {
    return {false, std::nullopt, c, m};
  }
};

/// \brief Outcome of unverified claims extraction.
template <typename T> struct ClaimsResult
{
  bool ok{false};
  std::optional<T> claims;
  ErrorKind code{ErrorKind::None};
  std::string message;

  static ClaimsResult success(T value) { return {true, std::move(value), ErrorKind::None, ""}; }

  static ClaimsResult failure(ErrorKind c, const std::string &m)
  {
    return {false, std::nullopt, c, m};
  }
};

} // namespace edgeguard
