// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace edgeguard
{
namespace util
{

/// \brief Raised when base64 input is malformed.
class Base64Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

namespace detail
{
  constexpr char kStdTable[65] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  constexpr char kUrlTable[65] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

  inline std::string encode(const std::uint8_t* data, std::size_t len, const char* table,
                            bool pad)
  {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 3 <= len)
    {
      std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                        (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                        (static_cast<std::uint32_t>(data[i + 2]));
      out.push_back(table[(v >> 18) & 0x3F]);
      out.push_back(table[(v >> 12) & 0x3F]);
      out.push_back(table[(v >> 6) & 0x3F]);
      out.push_back(table[v & 0x3F]);
      i += 3;
    }

    std::size_t rem = len - i;
    if (rem == 1)
    {
      std::uint32_t v = static_cast<std::uint32_t>(data[i]) << 16;
      out.push_back(table[(v >> 18) & 0x3F]);
      out.push_back(table[(v >> 12) & 0x3F]);
      if (pad)
      {
        out += "==";
      }
    }
    else if (rem == 2)
    {
      std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                        (static_cast<std::uint32_t>(data[i + 1]) << 8);
      out.push_back(table[(v >> 18) & 0x3F]);
      out.push_back(table[(v >> 12) & 0x3F]);
      out.push_back(table[(v >> 6) & 0x3F]);
      if (pad)
      {
        out += "=";
      }
    }
    return out;
  }

  inline int symbolValue(char c, const char* table)
  {
    for (int i = 0; i < 64; ++i)
    {
      if (table[i] == c)
      {
        return i;
      }
    }
    return -1;
  }

  /// \brief Strict decoder shared by every variant.
  /// \param padded true: canonical '=' padding required; false: '=' rejected
  /// \throws Base64Error on an invalid symbol, length, padding or trailing bits
  inline std::vector<std::uint8_t> decode(const std::string& in, const char* table, bool padded)
  {
    std::size_t dataLen = in.size();
    if (padded)
    {
      if (in.size() % 4 != 0)
      {
        throw Base64Error("Invalid input length " + std::to_string(in.size()));
      }
      while (dataLen > 0 && in.size() - dataLen < 2 && in[dataLen - 1] == '=')
      {
        --dataLen;
      }
    }

    if (dataLen % 4 == 1)
    {
      throw Base64Error("Invalid input length " + std::to_string(in.size()));
    }

    std::vector<std::uint8_t> out;
    out.reserve((dataLen * 3) / 4);

    std::uint32_t acc = 0;
    int bits = 0;
    for (std::size_t i = 0; i < dataLen; ++i)
    {
      int value = symbolValue(in[i], table);
      if (value < 0)
      {
        throw Base64Error("Invalid symbol " + std::to_string(static_cast<unsigned char>(in[i])) +
                          ", offset " + std::to_string(i));
      }
      acc = (acc << 6) | static_cast<std::uint32_t>(value);
      bits += 6;
      if (bits >= 8)
      {
        bits -= 8;
        out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
      }
    }

    // Leftover bits of the final symbol must be zero for a canonical encoding
    if (bits > 0 && (acc & ((1u << bits) - 1)) != 0)
    {
      throw Base64Error("Invalid last symbol " +
                        std::to_string(static_cast<unsigned char>(in[dataLen - 1])) +
                        ", offset " + std::to_string(dataLen - 1));
    }
    return out;
  }
} // namespace detail

/// \brief Standard Base64 (RFC 4648 section 4) with '=' padding.
class Base64
{
public:
  static std::string encode(const std::uint8_t* data, std::size_t len)
  {
    return detail::encode(data, len, detail::kStdTable, true);
  }

  static std::string encode(const std::vector<std::uint8_t>& bytes)
  {
    return encode(bytes.data(), bytes.size());
  }

  static std::string encode(const std::string& text)
  {
    return encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
  }

  /// \throws Base64Error on malformed input
  static std::vector<std::uint8_t> decode(const std::string& b64)
  {
    return detail::decode(b64, detail::kStdTable, true);
  }
};

/// \brief Base64URL (RFC 4648 section 5).
///
/// Uses '-' and '_' instead of '+' and '/'. The default encoding omits
/// padding, making it suitable for URLs, filenames and token segments.
class Base64Url
{
public:
  /// \brief Encode binary data to Base64URL string (no padding).
  static std::string encode(const std::uint8_t* data, std::size_t len)
  {
    return detail::encode(data, len, detail::kUrlTable, false);
  }

  static std::string encode(const std::vector<std::uint8_t>& bytes)
  {
    return encode(bytes.data(), bytes.size());
  }

  static std::string encode(const std::string& text)
  {
    return encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
  }

  /// \brief Encode with '=' padding.
  static std::string encodePadded(const std::vector<std::uint8_t>& bytes)
  {
    return detail::encode(bytes.data(), bytes.size(), detail::kUrlTable, true);
  }

  /// \brief Decode padded Base64URL.
  /// \throws Base64Error on malformed input or non-canonical padding
  static std::vector<std::uint8_t> decode(const std::string& b64)
  {
    return detail::decode(b64, detail::kUrlTable, true);
  }

  /// \brief Decode unpadded Base64URL; any '=' is rejected.
  /// \throws Base64Error on malformed input
  static std::vector<std::uint8_t> decodeNoPad(const std::string& b64)
  {
    return detail::decode(b64, detail::kUrlTable, false);
  }

  /// \brief Non-throwing variant of decodeNoPad().
  static std::optional<std::vector<std::uint8_t>> tryDecodeNoPad(const std::string& b64)
  {
    try
    {
      return decodeNoPad(b64);
    }
    catch (const Base64Error&)
    {
      return std::nullopt;
    }
  }
};

} // namespace util
} // namespace edgeguard
