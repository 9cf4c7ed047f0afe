// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0

/// \file ip_utils.hpp
/// \brief IP address parsing and CIDR matching
///
/// Provides:
/// - Strict IPv4 and IPv6 literal parsing
/// - A family-tagged IpAddress value
/// - CIDR notation parsing and containment for both address families

#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace edgeguard
{
namespace network
{

/// \brief IPv4 address parsing and manipulation utilities
class IPv4
{
public:
  /// \brief Parse IPv4 address string to 32-bit integer
  /// \param ip IPv4 address string (e.g., "192.168.1.1")
  /// \param result Output 32-bit integer in host byte order
  /// \return true if parsed successfully
  /// \note Rejects leading zeros to prevent octal interpretation ambiguity
  static bool parse(const std::string& ip, std::uint32_t& result)
  {
    std::uint32_t value = 0;
    std::size_t pos = 0;

    for (std::size_t i = 0; i < 4; ++i)
    {
      if (i > 0)
      {
        if (pos >= ip.length() || ip[pos] != '.')
        {
          return false;
        }
        ++pos;
      }

      std::size_t octetStart = pos;
      std::uint32_t octet = 0;
      while (pos < ip.length() && std::isdigit(static_cast<unsigned char>(ip[pos])))
      {
        octet = octet * 10 + static_cast<std::uint32_t>(ip[pos] - '0');
        if (octet > 255)
        {
          return false;
        }
        ++pos;
      }

      std::size_t octetLen = pos - octetStart;
      if (octetLen == 0 || (octetLen > 1 && ip[octetStart] == '0'))
      {
        return false;
      }

      value = (value << 8) | octet;
    }

    if (pos != ip.length())
    {
      return false;
    }

    result = value;
    return true;
  }

  /// \brief Convert 32-bit integer to dotted decimal
  static std::string toString(std::uint32_t ip)
  {
    return std::to_string((ip >> 24) & 0xFF) + "." +
           std::to_string((ip >> 16) & 0xFF) + "." +
           std::to_string((ip >> 8) & 0xFF) + "." +
           std::to_string(ip & 0xFF);
  }

  /// \brief Create netmask from CIDR prefix length (0-32)
  static std::uint32_t prefixToNetmask(std::uint32_t prefixLength)
  {
    if (prefixLength == 0)
    {
      return 0;
    }
    if (prefixLength >= 32)
    {
      return 0xFFFFFFFF;
    }
    return ~((1u << (32 - prefixLength)) - 1);
  }

  /// \brief Check if IP address is within a network
  static bool inNetwork(std::uint32_t ip, std::uint32_t network, std::uint32_t prefixLength)
  {
    std::uint32_t mask = prefixToNetmask(prefixLength);
    return (ip & mask) == (network & mask);
  }
};

/// \brief IPv6 address parsing and manipulation utilities
class IPv6
{
public:
  /// \brief 128-bit IPv6 address in network byte order
  using Address = std::array<std::uint8_t, 16>;

  /// \brief Parse IPv6 address string to 128-bit byte array
  /// \param ip IPv6 address string (e.g., "2001:db8::1", "::1", "64:ff9b::192.0.2.1")
  /// \param result Output 128-bit address
  /// \return true if parsed successfully
  /// \note The last 32 bits may be written as a dotted quad. Zone identifiers
  ///       are rejected.
  static bool parse(const std::string& ip, Address& result)
  {
    if (ip.size() < 2)
    {
      return false;
    }

    Address parsed{};
    std::string head = ip;
    bool embeddedV4 = false;

    auto lastColon = ip.rfind(':');
    if (lastColon != std::string::npos && ip.find('.', lastColon) != std::string::npos)
    {
      std::uint32_t ipv4 = 0;
      if (!IPv4::parse(ip.substr(lastColon + 1), ipv4))
      {
        return false;
      }
      parsed[12] = static_cast<std::uint8_t>((ipv4 >> 24) & 0xFF);
      parsed[13] = static_cast<std::uint8_t>((ipv4 >> 16) & 0xFF);
      parsed[14] = static_cast<std::uint8_t>((ipv4 >> 8) & 0xFF);
      parsed[15] = static_cast<std::uint8_t>(ipv4 & 0xFF);
      embeddedV4 = true;
      // "::" directly before the quad stays with the hex part
      bool compressed = lastColon > 0 && ip[lastColon - 1] == ':';
      head = ip.substr(0, compressed ? lastColon + 1 : lastColon);
    }

    std::vector<std::uint16_t> groups;
    std::size_t doubleColonPos = 0;
    bool seenDoubleColon = false;
    std::size_t pos = 0;

    if (head.compare(0, 2, "::") == 0)
    {
      seenDoubleColon = true;
      pos = 2;
    }

    while (pos < head.length())
    {
      std::size_t colonPos = head.find(':', pos);
      std::string group = head.substr(pos, colonPos == std::string::npos ? std::string::npos
                                                                       : colonPos - pos);
      if (!parseGroup(group, groups))
      {
        return false;
      }

      if (colonPos == std::string::npos)
      {
        break;
      }

      if (colonPos + 1 < head.length() && head[colonPos + 1] == ':')
      {
        if (seenDoubleColon)
        {
          return false; // Multiple :: not allowed
        }
        seenDoubleColon = true;
        doubleColonPos = groups.size();
        pos = colonPos + 2;
      }
      else
      {
        if (colonPos + 1 == head.length())
        {
          return false; // Trailing single colon
        }
        pos = colonPos + 1;
      }
    }

    std::size_t totalGroups = groups.size() + (embeddedV4 ? 2 : 0);
    if (seenDoubleColon ? totalGroups > 7 : totalGroups != 8)
    {
      return false;
    }

    std::size_t zerosNeeded = 8 - totalGroups;
    std::size_t slot = 0;
    for (std::size_t i = 0; i < groups.size(); ++i)
    {
      if (seenDoubleColon && i == doubleColonPos)
      {
        slot += zerosNeeded;
      }
      parsed[slot * 2] = static_cast<std::uint8_t>((groups[i] >> 8) & 0xFF);
      parsed[slot * 2 + 1] = static_cast<std::uint8_t>(groups[i] & 0xFF);
      ++slot;
    }

    result = parsed;
    return true;
  }

  /// \brief Convert 128-bit address to IPv6 string (RFC 5952 compressed form)
  static std::string toString(const Address& addr)
  {
    std::array<std::uint16_t, 8> groups{};
    for (std::size_t i = 0; i < 8; ++i)
    {
      groups[i] = static_cast<std::uint16_t>((addr[i * 2] << 8) | addr[i * 2 + 1]);
    }

    // Longest run of zero groups; only runs > 1 are compressed
    std::size_t bestStart = 8;
    std::size_t bestLen = 1;
    std::size_t curStart = 0;
    std::size_t curLen = 0;
    for (std::size_t i = 0; i < 8; ++i)
    {
      if (groups[i] != 0)
      {
        curLen = 0;
        continue;
      }
      if (curLen == 0)
      {
        curStart = i;
      }
      ++curLen;
      if (curLen > bestLen)
      {
        bestStart = curStart;
        bestLen = curLen;
      }
    }

    std::ostringstream oss;
    oss << std::hex;
    for (std::size_t i = 0; i < 8; ++i)
    {
      if (i == bestStart)
      {
        oss << "::";
        i += bestLen - 1;
        continue;
      }
      if (i > 0 && i != bestStart + bestLen)
      {
        oss << ":";
      }
      oss << groups[i];
    }
    return oss.str();
  }

  /// \brief Check if IP address is within a network
  /// \param prefixLength CIDR prefix length (0-128)
  static bool inNetwork(const Address& ip, const Address& network, std::uint32_t prefixLength)
  {
    if (prefixLength > 128)
    {
      prefixLength = 128;
    }

    std::size_t fullBytes = prefixLength / 8;
    std::size_t remainingBits = prefixLength % 8;

    for (std::size_t i = 0; i < fullBytes; ++i)
    {
      if (ip[i] != network[i])
      {
        return false;
      }
    }

    if (remainingBits > 0 && fullBytes < 16)
    {
      std::uint8_t mask = static_cast<std::uint8_t>(0xFF << (8 - remainingBits));
      if ((ip[fullBytes] & mask) != (network[fullBytes] & mask))
      {
        return false;
      }
    }

    return true;
  }

  /// \brief True if any bit past \p prefixLength is set
  static bool hasHostBits(const Address& addr, std::uint32_t prefixLength)
  {
    for (std::size_t bit = prefixLength; bit < 128; ++bit)
    {
      if (addr[bit / 8] & (0x80 >> (bit % 8)))
      {
        return true;
      }
    }
    return false;
  }

private:
  static bool parseGroup(const std::string& group, std::vector<std::uint16_t>& groups)
  {
    if (group.empty() || group.length() > 4)
    {
      return false;
    }

    std::uint16_t value = 0;
    for (char c : group)
    {
      if (!std::isxdigit(static_cast<unsigned char>(c)))
      {
        return false;
      }
      int digit = std::isdigit(static_cast<unsigned char>(c))
                    ? c - '0'
                    : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
      value = static_cast<std::uint16_t>((value << 4) | digit);
    }
    groups.push_back(value);
    return true;
  }
};

/// \brief Address family enumeration
enum class AddressFamily
{
  IPv4,
  IPv6
};

/// \brief A parsed IPv4 or IPv6 address
class IpAddress
{
public:
  IpAddress() = default;

  /// \brief Parse an address literal, auto-detecting the family
  /// \return std::nullopt if \p text is not a valid IPv4 or IPv6 literal
  static std::optional<IpAddress> parse(const std::string& text)
  {
    IpAddress addr;
    if (text.find(':') == std::string::npos)
    {
      if (!IPv4::parse(text, addr._ipv4))
      {
        return std::nullopt;
      }
      addr._family = AddressFamily::IPv4;
      return addr;
    }
    if (!IPv6::parse(text, addr._ipv6))
    {
      return std::nullopt;
    }
    addr._family = AddressFamily::IPv6;
    return addr;
  }

  static IpAddress fromV4(std::uint32_t ip)
  {
    IpAddress addr;
    addr._family = AddressFamily::IPv4;
    addr._ipv4 = ip;
    return addr;
  }

  static IpAddress fromV6(const IPv6::Address& ip)
  {
    IpAddress addr;
    addr._family = AddressFamily::IPv6;
    addr._ipv6 = ip;
    return addr;
  }

  AddressFamily family() const { return _family; }
  bool isV4() const { return _family == AddressFamily::IPv4; }
  bool isV6() const { return _family == AddressFamily::IPv6; }

  /// \brief IPv4 value in host byte order (only meaningful for IPv4)
  std::uint32_t ipv4() const { return _ipv4; }

  /// \brief IPv6 bytes (only meaningful for IPv6)
  const IPv6::Address& ipv6() const { return _ipv6; }

  std::string toString() const
  {
    return isV4() ? IPv4::toString(_ipv4) : IPv6::toString(_ipv6);
  }

  bool operator==(const IpAddress& other) const
  {
    if (_family != other._family)
    {
      return false;
    }
    return isV4() ? _ipv4 == other._ipv4 : _ipv6 == other._ipv6;
  }

  bool operator!=(const IpAddress& other) const { return !(*this == other); }

private:
  AddressFamily _family{AddressFamily::IPv4};
  std::uint32_t _ipv4{0};
  IPv6::Address _ipv6{};
};

inline std::ostream& operator<<(std::ostream& os, const IpAddress& addr)
{
  return os << addr.toString();
}

/// \brief CIDR network (IPv4 or IPv6)
///
/// The address part must be the network address: "10.0.0.1/8" is rejected
/// rather than widened to 10.0.0.0/8.
class CidrNetwork
{
public:
  /// \brief Parse CIDR notation
  /// \param cidr e.g. "192.168.1.0/24", "10.0.0.1" (single host), "2001:db8::/32"
  /// \return std::nullopt on a malformed address, an out-of-range prefix or
  ///         host bits set past the prefix
  static std::optional<CidrNetwork> parse(const std::string& cidr)
  {
    auto slashPos = cidr.find('/');
    auto address = IpAddress::parse(cidr.substr(0, slashPos));
    if (!address)
    {
      return std::nullopt;
    }

    std::uint32_t maxPrefix = address->isV6() ? 128 : 32;
    std::uint32_t prefix = maxPrefix;
    if (slashPos != std::string::npos)
    {
      std::string prefixText = cidr.substr(slashPos + 1);
      if (prefixText.empty() || prefixText.size() > 3)
      {
        return std::nullopt;
      }
      prefix = 0;
      for (char c : prefixText)
      {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
          return std::nullopt;
        }
        prefix = prefix * 10 + static_cast<std::uint32_t>(c - '0');
      }
      if (prefix > maxPrefix)
      {
        return std::nullopt;
      }
    }

    bool hostBits = address->isV4()
                      ? (address->ipv4() & ~IPv4::prefixToNetmask(prefix)) != 0
                      : IPv6::hasHostBits(address->ipv6(), prefix);
    if (hostBits)
    {
      return std::nullopt;
    }

    return CidrNetwork(*address, prefix);
  }

  CidrNetwork(const IpAddress& address, std::uint32_t prefixLength)
      : _address(address), _prefixLength(prefixLength)
  {
  }

  const IpAddress& address() const { return _address; }
  std::uint32_t prefixLength() const { return _prefixLength; }
  AddressFamily family() const { return _address.family(); }

  /// \brief Check if an address lies within this network
  /// \note Addresses of the other family never match.
  bool contains(const IpAddress& ip) const
  {
    if (ip.family() != _address.family())
    {
      return false;
    }
    if (ip.isV4())
    {
      return IPv4::inNetwork(ip.ipv4(), _address.ipv4(), _prefixLength);
    }
    return IPv6::inNetwork(ip.ipv6(), _address.ipv6(), _prefixLength);
  }

  bool isSingleHost() const { return _prefixLength == (_address.isV6() ? 128u : 32u); }

  std::string toString() const
  {
    return _address.toString() + "/" + std::to_string(_prefixLength);
  }

private:
  IpAddress _address;
  std::uint32_t _prefixLength;
};

} // namespace network
} // namespace edgeguard
