// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <edgeguard/common/errors.hpp>
#include <edgeguard/core/json.hpp>
#include <edgeguard/core/logger.hpp>
#include <edgeguard/util/base64.hpp>
#include <edgeguard/util/strings.hpp>

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace edgeguard
{
namespace auth
{

/// \brief Decode the claims of a "header.body.signature" token WITHOUT
/// verifying its signature.
///
/// The result is attacker controlled. Use it for routing, logging or
/// choosing a verification key, never as proof of identity.
///
/// \tparam T any type nlohmann::json can convert to (from_json or
/// NLOHMANN_DEFINE_TYPE_*), or core::Json itself
template <typename T> ClaimsResult<T> extractUnverifiedClaims(const std::string &token)
{
  auto afterHeader = util::splitOnce(token, '.');
  auto bodyAndSig = afterHeader ? util::splitOnce(afterHeader->second, '.') : std::nullopt;
  if (!bodyAndSig)
  {
    return ClaimsResult<T>::failure(ErrorKind::MalformedToken, "Invalid or malformed JWT Token");
  }
  const std::string &body = bodyAndSig->first;

  std::vector<std::uint8_t> bytes;
  try
  {
    bytes = util::Base64Url::decodeNoPad(body);
  }
  catch (const util::Base64Error &e)
  {
    EDGEGUARD_LOG_ERROR("Error decoding JWT token body '" << body << "' from base64: " << e.what());
    return ClaimsResult<T>::failure(ErrorKind::MalformedTokenBody, "Invalid JWT Token body");
  }

  try
  {
    auto json = core::Json::parse(util::utf8Lossy(bytes));
    return ClaimsResult<T>::success(json.template get<T>());
  }
  catch (const std::exception &e)
  {
    EDGEGUARD_LOG_ERROR("Error deserializing JWT Token claims: " << e.what());
    return ClaimsResult<T>::failure(ErrorKind::MalformedTokenClaims, "Invalid JWT Token claims");
  }
}

/// \brief Build an unsigned token ("alg": "none", empty signature) carrying
/// \p claims.
inline std::string encodeUnverifiedToken(const core::Json &claims)
{
  core::Json header = {{"alg", "none"}, {"typ", "JWT"}};
  return util::Base64Url::encode(header.dump()) + "." + util::Base64Url::encode(claims.dump()) +
         ".";
}

} // namespace auth
} // namespace edgeguard
