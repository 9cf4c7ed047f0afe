// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <edgeguard/network/forwarded.hpp>
#include <edgeguard/parsers/http_message.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace edgeguard
{
namespace network
{

/// \brief What the client IP resolver needs to know about a request.
class RequestView
{
public:
  virtual ~RequestView() = default;

  /// \brief Transport peer address without port, if the transport knows it.
  virtual std::optional<std::string> peerAddress() const = 0;

  /// \brief Value of the first \p name field (case-insensitive), if present.
  virtual std::optional<std::string> header(const std::string &name) const = 0;

  /// \brief Every \p name field joined with ", " in arrival order.
  virtual std::optional<std::string> headerList(const std::string &name) const
  {
    return header(name);
  }

  /// \brief Client address named by the standard forwarding headers,
  /// falling back to the peer address.
  virtual std::optional<std::string> forwardedAddress() const
  {
    return forwarded::resolve(headerList("Forwarded"), headerList("X-Forwarded-For"),
                              peerAddress());
  }
};

/// \brief A request accepted by a server socket.
struct ServerRequest
{
  HttpMethod method{HttpMethod::GET};
  std::string path;
  HttpHeaders headers;
  std::string body;
  std::unordered_map<std::string, std::string> params;
  std::string remote_addr;       // empty if the transport reported no peer
  std::uint16_t remote_port = 0;

  /// \brief First value of \p key, or empty
  std::string get_header_value(const std::string &key) const
  {
    return firstHeaderValue(headers, key).value_or("");
  }

  bool has_header(const std::string &key) const { return headers.count(key) != 0; }
};

class ServerRequestView : public RequestView
{
public:
  explicit ServerRequestView(const ServerRequest &request) : _request(request) {}

  std::optional<std::string> peerAddress() const override
  {
    if (_request.remote_addr.empty())
    {
      return std::nullopt;
    }
    return forwarded::stripPort(_request.remote_addr);
  }

  std::optional<std::string> header(const std::string &name) const override
  {
    return firstHeaderValue(_request.headers, name);
  }

  std::optional<std::string> headerList(const std::string &name) const override
  {
    return combinedHeaderValue(_request.headers, name);
  }

private:
  const ServerRequest &_request;
};

/// \brief View over a parsed HttpRequest. The peer address comes from the
/// connection, since the message itself does not carry it.
class HttpRequestView : public RequestView
{
public:
  HttpRequestView(const HttpRequest &request, std::optional<std::string> peer)
    : _request(request), _peer(std::move(peer))
  {
  }

  std::optional<std::string> peerAddress() const override
  {
    if (!_peer || _peer->empty())
    {
      return std::nullopt;
    }
    return forwarded::stripPort(*_peer);
  }

  std::optional<std::string> header(const std::string &name) const override
  {
    return _request.firstHeader(name);
  }

  std::optional<std::string> headerList(const std::string &name) const override
  {
    return _request.findHeader(name);
  }

private:
  const HttpRequest &_request;
  std::optional<std::string> _peer;
};

} // namespace network
} // namespace edgeguard
