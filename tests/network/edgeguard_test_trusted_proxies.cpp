// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <thread>

using edgeguard::core::Logger;
using edgeguard::network::ProxyTrustList;
using edgeguard::test::ip;
using edgeguard::test::LogCapture;

namespace
{
const char *kProxies = "\n"
                       "192.168.100.0/24\n"
                       "  192.168.0.96/28   \n"
                       "\n"
                       "172.16.0.1/32\n"
                       "10.10.10.10/31\n";
} // namespace

TEST_CASE("Trust list from a multi-line string", "[proxies][build]")
{
  LogCapture capture;
  auto list = ProxyTrustList::build(kProxies);

  REQUIRE(list.size() == 4);
  REQUIRE_FALSE(list.empty());
  REQUIRE(capture.count(Logger::Level::Error) == 0);
  REQUIRE(list.toString() ==
          "192.168.100.0/24, 192.168.0.96/28, 172.16.0.1/32, 10.10.10.10/31");

  SECTION("/24 range")
  {
    REQUIRE(list.isTrusted(ip("192.168.100.0")));
    REQUIRE(list.isTrusted(ip("192.168.100.1")));
    REQUIRE(list.isTrusted(ip("192.168.100.255")));
    REQUIRE_FALSE(list.isTrusted(ip("192.168.99.255")));
    REQUIRE_FALSE(list.isTrusted(ip("192.168.101.0")));
  }

  SECTION("/28 range")
  {
    REQUIRE(list.isTrusted(ip("192.168.0.96")));
    REQUIRE(list.isTrusted(ip("192.168.0.100")));
    REQUIRE(list.isTrusted(ip("192.168.0.111")));
    REQUIRE_FALSE(list.isTrusted(ip("192.168.0.95")));
    REQUIRE_FALSE(list.isTrusted(ip("192.168.0.112")));
  }

  SECTION("Single host")
  {
    REQUIRE(list.isTrusted(ip("172.16.0.1")));
    REQUIRE_FALSE(list.isTrusted(ip("172.16.0.0")));
    REQUIRE_FALSE(list.isTrusted(ip("172.16.0.2")));
  }

  SECTION("/31 pair")
  {
    REQUIRE(list.isTrusted(ip("10.10.10.10")));
    REQUIRE(list.isTrusted(ip("10.10.10.11")));
    REQUIRE_FALSE(list.isTrusted(ip("10.10.10.9")));
    REQUIRE_FALSE(list.isTrusted(ip("10.10.10.12")));
  }

  SECTION("IPv6 never matches IPv4 ranges")
  {
    REQUIRE_FALSE(list.isTrusted(ip("::ffff:192.168.100.1")));
    REQUIRE_FALSE(list.isTrusted(ip("::1")));
  }
}

TEST_CASE("Malformed entries are logged and skipped", "[proxies][errors]")
{
  LogCapture capture;
  auto list = ProxyTrustList::build("10.0.0.0/8\n"
                                    "not-a-cidr\n"
                                    "192.168.1.0/33\n"
                                    "2001:db8::/32\n");

  REQUIRE(list.size() == 2);
  REQUIRE(capture.count(Logger::Level::Error) == 2);
  REQUIRE(capture.contains(Logger::Level::Error, "not-a-cidr"));
  REQUIRE(capture.contains(Logger::Level::Error, "192.168.1.0/33"));

  REQUIRE(list.isTrusted(ip("10.255.255.255")));
  REQUIRE(list.isTrusted(ip("2001:db8:ffff::1")));
  REQUIRE_FALSE(list.isTrusted(ip("2001:db9::1")));
}

TEST_CASE("Entries with host bits set are logged and skipped", "[proxies][errors]")
{
  LogCapture capture;
  auto list = ProxyTrustList::build("10.0.0.1/8\n"
                                    "192.168.0.97/28\n");

  REQUIRE(list.empty());
  REQUIRE(capture.count(Logger::Level::Error) == 2);
  REQUIRE(capture.contains(Logger::Level::Error, "'10.0.0.1/8'"));
  REQUIRE(capture.contains(Logger::Level::Error, "'192.168.0.97/28'"));

  REQUIRE_FALSE(list.isTrusted(ip("10.200.3.4")));
  REQUIRE_FALSE(list.isTrusted(ip("10.0.0.1")));
  REQUIRE_FALSE(list.isTrusted(ip("192.168.0.100")));

  auto mixed = ProxyTrustList::build("10.0.0.1/8\n10.0.0.1/32\n");
  REQUIRE(mixed.size() == 1);
  REQUIRE(mixed.isTrusted(ip("10.0.0.1")));
  REQUIRE_FALSE(mixed.isTrusted(ip("10.0.0.2")));
}

TEST_CASE("Empty configuration gives an empty list", "[proxies][empty]")
{
  auto blank = ProxyTrustList::build("");
  REQUIRE(blank.empty());
  REQUIRE_FALSE(blank.isTrusted(ip("127.0.0.1")));

  auto whitespace = ProxyTrustList::build("\n   \n\t\n");
  REQUIRE(whitespace.empty());
  REQUIRE(whitespace.toString().empty());
}

TEST_CASE("Trust list from individual entries", "[proxies][entries]")
{
  LogCapture capture;
  auto list = ProxyTrustList::fromEntries({"10.0.0.0/8", " ", "bogus", " fd00::/8 "});
  REQUIRE(list.size() == 2);
  REQUIRE(capture.count(Logger::Level::Error) == 1);
  REQUIRE(list.isTrusted(ip("fd12::1")));
  REQUIRE(list.networks().front().toString() == "10.0.0.0/8");
}

TEST_CASE("Concurrent lookups on a shared list", "[proxies][concurrency]")
{
  const auto list = ProxyTrustList::build(kProxies);
  std::vector<std::thread> threads;
  std::vector<int> hits(8, 0);
  for (int t = 0; t < 8; ++t)
  {
    threads.emplace_back(
      [&list, &hits, t]()
      {
        for (int i = 0; i < 1000; ++i)
        {
          if (list.isTrusted(ip("192.168.100.7")) && !list.isTrusted(ip("8.8.8.8")))
          {
            ++hits[t];
          }
        }
      });
  }
  for (auto &th : threads)
  {
    th.join();
  }
  for (int h : hits)
  {
    REQUIRE(h == 1000);
  }
}
