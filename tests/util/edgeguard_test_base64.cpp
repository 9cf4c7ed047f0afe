// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using edgeguard::util::Base64;
using edgeguard::util::Base64Error;
using edgeguard::util::Base64Url;

namespace
{
std::vector<std::uint8_t> bytesOf(const std::string &s) { return {s.begin(), s.end()}; }
} // namespace

TEST_CASE("Standard base64 test vectors", "[base64][std]")
{
  // RFC 4648 section 10
  REQUIRE(Base64::encode(std::string()) == "");
  REQUIRE(Base64::encode(std::string("f")) == "Zg==");
  REQUIRE(Base64::encode(std::string("fo")) == "Zm8=");
  REQUIRE(Base64::encode(std::string("foo")) == "Zm9v");
  REQUIRE(Base64::encode(std::string("foob")) == "Zm9vYg==");
  REQUIRE(Base64::encode(std::string("fooba")) == "Zm9vYmE=");
  REQUIRE(Base64::encode(std::string("foobar")) == "Zm9vYmFy");

  REQUIRE(Base64::decode("") == bytesOf(""));
  REQUIRE(Base64::decode("Zg==") == bytesOf("f"));
  REQUIRE(Base64::decode("Zm9vYmE=") == bytesOf("fooba"));
  REQUIRE(Base64::decode("Zm9vYmFy") == bytesOf("foobar"));
}

TEST_CASE("Standard base64 rejects malformed input", "[base64][std][errors]")
{
  REQUIRE_THROWS_AS(Base64::decode("Zg"), Base64Error);
  REQUIRE_THROWS_AS(Base64::decode("Zg="), Base64Error);
  REQUIRE_THROWS_AS(Base64::decode("Z==="), Base64Error);
  REQUIRE_THROWS_AS(Base64::decode("Zm=v"), Base64Error);
  REQUIRE_THROWS_AS(Base64::decode("Zm9v\n"), Base64Error);
  REQUIRE_THROWS_AS(Base64::decode("-_8="), Base64Error);
  REQUIRE_THROWS_AS(Base64::decode("Zh=="), Base64Error);
}

TEST_CASE("URL-safe base64", "[base64][url]")
{
  const std::vector<std::uint8_t> awkward = {0xfb, 0xff};

  SECTION("Alphabet and padding")
  {
    REQUIRE(Base64::encode(awkward) == "+/8=");
    REQUIRE(Base64Url::encode(awkward) == "-_8");
    REQUIRE(Base64Url::encodePadded(awkward) == "-_8=");
    REQUIRE(Base64Url::encode(std::string("foobar")) == "Zm9vYmFy");
  }

  SECTION("Padded decoding")
  {
    REQUIRE(Base64Url::decode("-_8=") == awkward);
    REQUIRE_THROWS_AS(Base64Url::decode("-_8"), Base64Error);
    REQUIRE_THROWS_AS(Base64Url::decode("+/8="), Base64Error);
  }

  SECTION("Unpadded decoding is strict")
  {
    REQUIRE(Base64Url::decodeNoPad("-_8") == awkward);
    REQUIRE(Base64Url::decodeNoPad("") == bytesOf(""));
    REQUIRE(Base64Url::decodeNoPad("Zm9vYg") == bytesOf("foob"));
    REQUIRE_THROWS_AS(Base64Url::decodeNoPad("-_8="), Base64Error);
    REQUIRE_THROWS_AS(Base64Url::decodeNoPad("Zm9vY"), Base64Error);
    REQUIRE_THROWS_AS(Base64Url::decodeNoPad("Zh"), Base64Error);
    REQUIRE_THROWS_AS(Base64Url::decodeNoPad("Zm9 v"), Base64Error);
  }

  SECTION("Non-throwing variant")
  {
    REQUIRE(Base64Url::tryDecodeNoPad("Zg") == bytesOf("f"));
    REQUIRE_FALSE(Base64Url::tryDecodeNoPad("***"));
  }

  SECTION("Every byte value survives encoding")
  {
    std::vector<std::uint8_t> all;
    for (int i = 0; i < 256; ++i)
    {
      all.push_back(static_cast<std::uint8_t>(i));
    }
    auto encoded = Base64Url::encode(all);
    REQUIRE(encoded.find_first_of("+/=") == std::string::npos);
    REQUIRE(Base64Url::decodeNoPad(encoded) == all);
    REQUIRE(Base64::decode(Base64::encode(all)) == all);
  }
}

TEST_CASE("Error messages name the offending symbol", "[base64][errors]")
{
  try
  {
    Base64Url::decodeNoPad("ab$d");
    FAIL("expected Base64Error");
  }
  catch (const Base64Error &e)
  {
    REQUIRE(std::string(e.what()) == "Invalid symbol 36, offset 2");
  }
}
