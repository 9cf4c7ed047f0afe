// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file http_message.hpp
/// \brief Inbound HTTP/1.x request head as seen by the request adapters.
///
/// Only the parts the edge needs are kept: the request line, a header map
/// with case-insensitive names and the raw body. Responses are never built
/// here.

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace edgeguard
{
namespace network
{

  enum class HttpMethod
  {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE
  };

  namespace detail
  {
    struct MethodName
    {
      const char* name;
      HttpMethod method;
    };

    constexpr MethodName kMethodNames[] = {
        {"GET", HttpMethod::GET},         {"POST", HttpMethod::POST},
        {"PUT", HttpMethod::PUT},         {"DELETE", HttpMethod::DELETE},
        {"HEAD", HttpMethod::HEAD},       {"OPTIONS", HttpMethod::OPTIONS},
        {"PATCH", HttpMethod::PATCH},     {"CONNECT", HttpMethod::CONNECT},
        {"TRACE", HttpMethod::TRACE},
    };

    inline bool isDigits(const std::string& s, std::size_t from, std::size_t to)
    {
      if (from >= to)
      {
        return false;
      }
      return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(from),
                         s.begin() + static_cast<std::ptrdiff_t>(to),
                         [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    inline std::string trimBlanks(const std::string& s)
    {
      auto first = s.find_first_not_of(" \t");
      if (first == std::string::npos)
      {
        return {};
      }
      auto last = s.find_last_not_of(" \t");
      return s.substr(first, last - first + 1);
    }
  } // namespace detail

  /// \brief Map a method token to HttpMethod, ignoring case
  /// \throws std::invalid_argument for methods outside the known set
  inline HttpMethod parseMethod(const std::string& method)
  {
    std::string upper = method;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (const auto& entry : detail::kMethodNames)
    {
      if (upper == entry.name)
      {
        return entry.method;
      }
    }
    throw std::invalid_argument("Unknown HTTP method: " + method);
  }

  inline const char* methodName(HttpMethod method)
  {
    for (const auto& entry : detail::kMethodNames)
    {
      if (entry.method == method)
      {
        return entry.name;
      }
    }
    return "UNKNOWN";
  }

  /// \brief Protocol version from the request line ("HTTP/<major>.<minor>")
  struct HttpVersion
  {
    int major{1};
    int minor{1};

    static HttpVersion parse(const std::string& version)
    {
      static const std::string prefix = "HTTP/";
      auto dot = version.find('.', prefix.size());
      if (version.compare(0, prefix.size(), prefix) != 0 || dot == std::string::npos ||
          !detail::isDigits(version, prefix.size(), dot) ||
          !detail::isDigits(version, dot + 1, version.size()))
      {
        throw std::invalid_argument("Invalid HTTP version: " + version);
      }

      HttpVersion result;
      result.major = std::stoi(version.substr(prefix.size(), dot - prefix.size()));
      result.minor = std::stoi(version.substr(dot + 1));
      return result;
    }
  };

  /// \brief Header name ordering that ignores ASCII case
  struct CaseInsensitiveCompare
  {
    bool operator()(const std::string& a, const std::string& b) const
    {
      return std::lexicographical_compare(
          a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y)
          { return std::tolower(x) < std::tolower(y); });
    }
  };

  /// \brief Header fields in arrival order; a repeated name keeps one entry
  /// per field line
  using HttpHeaders = std::multimap<std::string, std::string, CaseInsensitiveCompare>;

  inline void appendHeader(HttpHeaders& headers, const std::string& name, const std::string& value)
  {
    headers.emplace(name, value);
  }

  /// \brief Value of the first \p name field
  inline std::optional<std::string> firstHeaderValue(const HttpHeaders& headers,
                                                     const std::string& name)
  {
    auto range = headers.equal_range(name);
    if (range.first == range.second)
    {
      return std::nullopt;
    }
    return range.first->second;
  }

  /// \brief All \p name fields joined with ", " in arrival order
  inline std::optional<std::string> combinedHeaderValue(const HttpHeaders& headers,
                                                        const std::string& name)
  {
    auto range = headers.equal_range(name);
    if (range.first == range.second)
    {
      return std::nullopt;
    }
    std::string joined = range.first->second;
    for (auto it = std::next(range.first); it != range.second; ++it)
    {
      joined += ", " + it->second;
    }
    return joined;
  }

  /// \brief HTTP request message as received from a client
  class HttpRequest
  {
  public:
    HttpMethod method{HttpMethod::GET};
    std::string uri; // path + query string
    HttpVersion version{1, 1};
    HttpHeaders headers;
    std::string body;

    HttpRequest() = default;

    HttpRequest(HttpMethod m, const std::string& u) : method(m), uri(u) {}

    /// \brief Combined header value, or empty when absent
    std::string getHeader(const std::string& name) const
    {
      return findHeader(name).value_or(std::string{});
    }

    /// \brief Combined header value, distinguishing absent from empty
    std::optional<std::string> findHeader(const std::string& name) const
    {
      return combinedHeaderValue(headers, name);
    }

    /// \brief Value of the first field named \p name
    std::optional<std::string> firstHeader(const std::string& name) const
    {
      return firstHeaderValue(headers, name);
    }

    /// \brief Replace every \p name field with a single one
    void setHeader(const std::string& name, const std::string& value)
    {
      headers.erase(name);
      headers.emplace(name, value);
    }

    bool hasHeader(const std::string& name) const { return headers.count(name) != 0; }

    /// \brief Parse a request head (and body) from wire format
    /// Lines without a colon are ignored.
    /// \throws std::invalid_argument on a malformed request line or missing
    /// header terminator
    static HttpRequest fromWireFormat(const std::string& data)
    {
      auto headerEnd = data.find("\r\n\r\n");
      if (headerEnd == std::string::npos)
      {
        throw std::invalid_argument("Invalid HTTP request: missing header terminator");
      }

      HttpRequest request;
      request.body = data.substr(headerEnd + 4);

      std::size_t pos = 0;
      bool requestLine = true;
      while (pos <= headerEnd)
      {
        auto eol = data.find("\r\n", pos);
        std::string line = data.substr(pos, eol - pos);
        pos = eol + 2;

        if (requestLine)
        {
          request.parseRequestLine(line);
          requestLine = false;
          continue;
        }

        auto colon = line.find(':');
        if (colon != std::string::npos)
        {
          appendHeader(request.headers, detail::trimBlanks(line.substr(0, colon)),
                       detail::trimBlanks(line.substr(colon + 1)));
        }
      }

      return request;
    }

  private:
    void parseRequestLine(const std::string& line)
    {
      auto firstSpace = line.find(' ');
      auto lastSpace = line.rfind(' ');
      if (firstSpace == std::string::npos || firstSpace == lastSpace)
      {
        throw std::invalid_argument("Invalid HTTP request line: " + line);
      }

      uri = detail::trimBlanks(line.substr(firstSpace + 1, lastSpace - firstSpace - 1));
      if (uri.empty())
      {
        throw std::invalid_argument("Invalid HTTP request line: " + line);
      }
      method = parseMethod(line.substr(0, firstSpace));
      version = HttpVersion::parse(line.substr(lastSpace + 1));
    }
  };

} // namespace network
} // namespace edgeguard
