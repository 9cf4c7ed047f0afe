// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <edgeguard/common/errors.hpp>
#include <edgeguard/core/logger.hpp>
#include <edgeguard/edge_config.hpp>
#include <edgeguard/network/ip_utils.hpp>
#include <edgeguard/network/request_view.hpp>

#include <optional>
#include <string>

namespace edgeguard
{
namespace network
{

/// \brief Decides which address is the real client of a request.
///
/// Resolution order:
///   1. the configured peer IP header, honoured only from a trusted proxy
///   2. in proxy mode, the standard forwarding headers, again only from a
///      trusted proxy
///   3. otherwise the transport peer itself
///
/// The resolver holds a reference to an EdgeConfig that must outlive it.
/// resolve() is const and keeps no state, so one instance may serve any
/// number of threads.
class ClientIpResolver
{
public:
  explicit ClientIpResolver(const EdgeConfig &config) : _config(config) {}

  ResolveResult resolve(const RequestView &request) const
  {
    auto peer = parsePeer(request.peerAddress());
    if (!peer.ok)
    {
      return peer;
    }
    const IpAddress &peerIp = *peer.ip;

    if (auto overridden = fromCustomHeader(request))
    {
      if (!isTrustedProxy(peerIp))
      {
        return untrusted(peerIp);
      }
      EDGEGUARD_LOG_DEBUG("Client IP " << *overridden << " taken from header '"
                                       << *_config.peerIpHeaderName << "' set by proxy "
                                       << peerIp);
      return ResolveResult::success(*overridden);
    }

    if (_config.proxyMode)
    {
      if (!isTrustedProxy(peerIp))
      {
        return untrusted(peerIp);
      }
      return parsePeer(request.forwardedAddress());
    }

    return peer;
  }

private:
  ResolveResult parsePeer(const std::optional<std::string> &address) const
  {
    if (!address)
    {
      EDGEGUARD_LOG_ERROR("No IP address in connection info");
      return ResolveResult::failure(ErrorKind::MissingPeerAddress,
                                    "No IP Addr in Connection Info");
    }

    auto ip = IpAddress::parse(*address);
    if (!ip)
    {
      EDGEGUARD_LOG_ERROR("Cannot parse peer IP address: '" << *address << "'");
      return ResolveResult::failure(ErrorKind::MalformedPeerAddress,
                                    "Cannot parse peer IP address: '" + *address + "'");
    }
    return ResolveResult::success(*ip);
  }

  std::optional<IpAddress> fromCustomHeader(const RequestView &request) const
  {
    if (!_config.peerIpHeaderName)
    {
      return std::nullopt;
    }
    const std::string &name = *_config.peerIpHeaderName;

    if (auto value = request.header(name))
    {
      if (auto ip = IpAddress::parse(*value))
      {
        return ip;
      }
      EDGEGUARD_LOG_ERROR("Cannot parse IP from " << name << ": '" << *value << "'");
    }
    EDGEGUARD_LOG_TRACE("no peer IP from header '" << name << "'");
    return std::nullopt;
  }

  bool isTrustedProxy(const IpAddress &peerIp) const
  {
    return _config.trustedProxies.isTrusted(peerIp);
  }

  static ResolveResult untrusted(const IpAddress &peerIp)
  {
    EDGEGUARD_LOG_ERROR("Invalid request from IP " << peerIp << " which is not a trusted proxy");
    return ResolveResult::failure(ErrorKind::UntrustedProxy, "Invalid IP Address");
  }

  const EdgeConfig &_config;
};

} // namespace network
} // namespace edgeguard
