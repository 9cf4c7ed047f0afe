// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace edgeguard
{
namespace util
{

/// \brief Strip leading and trailing spaces, tabs, CR and LF.
inline std::string trim(const std::string &text)
{
  const char *ws = " \t\r\n";
  auto first = text.find_first_not_of(ws);
  if (first == std::string::npos)
  {
    return {};
  }
  auto last = text.find_last_not_of(ws);
  return text.substr(first, last - first + 1);
}

/// \brief Split at the first occurrence of \p delimiter.
/// \return std::nullopt if the delimiter does not occur
inline std::optional<std::pair<std::string, std::string>> splitOnce(const std::string &text,
                                                                    char delimiter)
{
  auto pos = text.find(delimiter);
  if (pos == std::string::npos)
  {
    return std::nullopt;
  }
  return std::make_pair(text.substr(0, pos), text.substr(pos + 1));
}

/// \brief Interpret bytes as UTF-8, replacing every maximal invalid
/// subsequence with U+FFFD. Never fails.
inline std::string utf8Lossy(const std::vector<std::uint8_t> &bytes)
{
  static const char kReplacement[] = "\xEF\xBF\xBD";

  std::string out;
  out.reserve(bytes.size());

  std::size_t i = 0;
  const std::size_t n = bytes.size();
  while (i < n)
  {
    std::uint8_t lead = bytes[i];
    if (lead < 0x80)
    {
      out.push_back(static_cast<char>(lead));
      ++i;
      continue;
    }

    // Expected length and the valid range of the second byte (Unicode 3.9, table 3-7)
    std::size_t need = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)
    {
      need = 2;
    }
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
      need = 3;
      if (lead == 0xE0)
        lo = 0xA0;
      else if (lead == 0xED)
        hi = 0x9F;
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
      need = 4;
      if (lead == 0xF0)
        lo = 0x90;
      else if (lead == 0xF4)
        hi = 0x8F;
    }

    if (need == 0)
    {
      out += kReplacement;
      ++i;
      continue;
    }

    std::size_t valid = 1;
    while (valid < need && i + valid < n)
    {
      std::uint8_t c = bytes[i + valid];
      std::uint8_t min = valid == 1 ? lo : 0x80;
      std::uint8_t max = valid == 1 ? hi : 0xBF;
      if (c < min || c > max)
      {
        break;
      }
      ++valid;
    }

    if (valid == need)
    {
      out.append(reinterpret_cast<const char *>(&bytes[i]), need);
    }
    else
    {
      out += kReplacement;
    }
    i += valid;
  }
  return out;
}

/// \brief Cache key under which a client entry is stored.
inline std::string cacheEntryClient(const std::string &id) { return "client_" + id; }

/// \brief Convert a flat JSON array literal of strings into its elements.
///
/// Deliberately simple: the first character is skipped, every '"' is dropped,
/// reading stops at the first ']' and the rest is split on ','. Nested arrays
/// and escaped quotes are not supported; "[]" yields a single empty element.
inline std::vector<std::string> jsonArrayToVector(const std::string &arr)
{
  std::string flat;
  for (std::size_t i = 1; i < arr.size(); ++i)
  {
    char c = arr[i];
    if (c == '"')
    {
      continue;
    }
    if (c == ']')
    {
      break;
    }
    flat += c;
  }

  std::vector<std::string> out;
  std::size_t start = 0;
  while (true)
  {
    auto comma = flat.find(',', start);
    out.push_back(flat.substr(start, comma == std::string::npos ? std::string::npos
                                                                : comma - start));
    if (comma == std::string::npos)
    {
      break;
    }
    start = comma + 1;
  }
  return out;
}

} // namespace util
} // namespace edgeguard
