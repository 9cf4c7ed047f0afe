// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace edgeguard
{
namespace crypto
{

/// \brief Cryptographically secure random data using OpenSSL RAND_bytes().
///
/// Suitable for identifiers that must not be guessable, such as store ids
/// and nonces.
class SecureRng
{
public:
  /// \brief Fill a buffer with cryptographically secure random bytes.
  /// \throws std::runtime_error if RAND_bytes fails
  static void fill(std::uint8_t *dst, std::size_t len)
  {
    if (len == 0)
    {
      return;
    }
    if (RAND_bytes(dst, static_cast<int>(len)) != 1)
    {
      throw std::runtime_error("SecureRng: RAND_bytes failed: " + lastError());
    }
  }

  /// \brief Fill a byte container with cryptographically secure random bytes.
  template <typename Container> static void fill(Container &c)
  {
    static_assert(sizeof(typename Container::value_type) == 1, "byte container required");
    fill(reinterpret_cast<std::uint8_t *>(c.data()), c.size());
  }

  /// \brief Random string over [A-Za-z0-9] with a uniform distribution.
  ///
  /// Bytes >= 248 are discarded so that each of the 62 symbols is equally
  /// likely (248 = 4 * 62).
  /// \throws std::runtime_error if RAND_bytes fails
  static std::string randomAlphanumeric(std::size_t count)
  {
    static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    static constexpr std::uint8_t kLimit = 248;

    std::string out;
    out.reserve(count);
    std::array<std::uint8_t, 64> buffer{};
    while (out.size() < count)
    {
      fill(buffer);
      for (std::uint8_t b : buffer)
      {
        if (b >= kLimit)
        {
          continue;
        }
        out.push_back(kAlphabet[b % 62]);
        if (out.size() == count)
        {
          break;
        }
      }
    }
    return out;
  }

private:
  static std::string lastError()
  {
    unsigned long code = ERR_peek_last_error(); // NOLINT(google-runtime-int)
    if (code == 0UL)
    {
      return "no OpenSSL error available";
    }
    char buf[256] = {0};
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
  }
};

/// \brief New random identifier for a persisted store entry (24 characters).
inline std::string newStoreId() { return SecureRng::randomAlphanumeric(24); }

} // namespace crypto
} // namespace edgeguard
