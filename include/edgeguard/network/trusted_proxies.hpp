// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <edgeguard/core/logger.hpp>
#include <edgeguard/network/ip_utils.hpp>
#include <edgeguard/util/strings.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace edgeguard
{
namespace network
{

/// \brief Immutable set of CIDR ranges whose peers may override the client IP.
///
/// Built once from configuration and then only read, so a single instance
/// can be shared by any number of concurrent resolvers without locking.
/// Entries that fail to parse are logged and skipped; they never invalidate
/// the rest of the list.
class ProxyTrustList
{
public:
  ProxyTrustList() = default;

  /// \brief Build from a multi-line string, one CIDR per line.
  /// Lines are trimmed; blank lines are ignored.
  static ProxyTrustList build(const std::string &raw)
  {
    std::vector<std::string> lines;
    std::istringstream stream(raw);
    std::string line;
    while (std::getline(stream, line))
    {
      lines.push_back(line);
    }
    return fromEntries(lines);
  }

  /// \brief Build from individual CIDR entries (e.g. a TOML string array).
  static ProxyTrustList fromEntries(const std::vector<std::string> &entries)
  {
    ProxyTrustList list;
    for (const auto &entry : entries)
    {
      std::string trimmed = util::trim(entry);
      if (trimmed.empty())
      {
        continue;
      }

      auto cidr = CidrNetwork::parse(trimmed);
      if (!cidr)
      {
        EDGEGUARD_LOG_ERROR("Cannot parse trusted proxy entry to CIDR: '" << trimmed << "'");
        continue;
      }
      list._networks.push_back(*cidr);
    }
    return list;
  }

  /// \brief True iff \p ip falls within at least one configured range.
  bool isTrusted(const IpAddress &ip) const
  {
    for (const auto &network : _networks)
    {
      if (network.contains(ip))
      {
        return true;
      }
    }
    return false;
  }

  const std::vector<CidrNetwork> &networks() const { return _networks; }
  std::size_t size() const { return _networks.size(); }
  bool empty() const { return _networks.empty(); }

  /// \brief Comma separated CIDR list for diagnostics
  std::string toString() const
  {
    std::string out;
    for (const auto &network : _networks)
    {
      if (!out.empty())
      {
        out += ", ";
      }
      out += network.toString();
    }
    return out;
  }

private:
  std::vector<CidrNetwork> _networks;
};

} // namespace network
} // namespace edgeguard
