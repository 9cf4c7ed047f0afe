// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using edgeguard::EdgeConfig;
using edgeguard::EdgeService;
using edgeguard::core::ConfigError;
using edgeguard::core::ConfigLoader;
using edgeguard::core::Logger;
using edgeguard::test::CleanEdgeEnvironment;
using edgeguard::test::ip;
using edgeguard::test::LogCapture;
using edgeguard::test::ScopedEnv;
using edgeguard::test::TempFile;

TEST_CASE("Configuration from the environment", "[edgeconfig][env]")
{
  CleanEdgeEnvironment clean;

  SECTION("TRUSTED_PROXIES is required")
  {
    REQUIRE_THROWS_AS(EdgeConfig::fromEnvironment(), ConfigError);
  }

  SECTION("All variables")
  {
    ScopedEnv proxies("TRUSTED_PROXIES", std::string("\n  192.168.100.0/24\n  10.10.10.10/31\n"));
    ScopedEnv header("PEER_IP_HEADER_NAME", std::string("X-Real-IP"));
    ScopedEnv mode("PROXY_MODE", std::string("true"));

    auto config = EdgeConfig::fromEnvironment();
    REQUIRE(config.trustedProxies.size() == 2);
    REQUIRE(config.trustedProxies.isTrusted(ip("10.10.10.11")));
    REQUIRE(config.peerIpHeaderName == std::string("X-Real-IP"));
    REQUIRE(config.proxyMode);
  }

  SECTION("Defaults")
  {
    ScopedEnv proxies("TRUSTED_PROXIES", std::string(""));
    auto config = EdgeConfig::fromEnvironment();
    REQUIRE(config.trustedProxies.empty());
    REQUIRE_FALSE(config.peerIpHeaderName);
    REQUIRE_FALSE(config.proxyMode);
  }

  SECTION("Empty header name means no header")
  {
    ScopedEnv proxies("TRUSTED_PROXIES", std::string("10.0.0.0/8"));
    ScopedEnv header("PEER_IP_HEADER_NAME", std::string("  "));
    REQUIRE_FALSE(EdgeConfig::fromEnvironment().peerIpHeaderName);
  }

  SECTION("PROXY_MODE accepts booleans only")
  {
    ScopedEnv proxies("TRUSTED_PROXIES", std::string("10.0.0.0/8"));
    {
      ScopedEnv mode("PROXY_MODE", std::string("1"));
      REQUIRE(EdgeConfig::fromEnvironment().proxyMode);
    }
    {
      ScopedEnv mode("PROXY_MODE", std::string("FALSE"));
      REQUIRE_FALSE(EdgeConfig::fromEnvironment().proxyMode);
    }
    {
      ScopedEnv mode("PROXY_MODE", std::string("yes"));
      REQUIRE_THROWS_AS(EdgeConfig::fromEnvironment(), ConfigError);
    }
  }

  SECTION("Malformed entries are skipped")
  {
    LogCapture capture;
    ScopedEnv proxies("TRUSTED_PROXIES", std::string("10.0.0.0/8\nbogus\n"));
    auto config = EdgeConfig::fromEnvironment();
    REQUIRE(config.trustedProxies.size() == 1);
    REQUIRE(capture.contains(Logger::Level::Error, "bogus"));
  }
}

TEST_CASE("Configuration from TOML", "[edgeconfig][toml]")
{
  CleanEdgeEnvironment clean;

  SECTION("Multi-line string list")
  {
    auto loader = ConfigLoader::fromString("[proxy]\n"
                                           "trusted_proxies = \"\"\"\n"
                                           "192.168.0.96/28\n"
                                           "172.16.0.1/32\n"
                                           "\"\"\"\n"
                                           "peer_ip_header = \"CF-Connecting-IP\"\n"
                                           "proxy_mode = true\n"
                                           "[log]\n"
                                           "level = \"debug\"\n"
                                           "format = \"%L %m\"\n");
    auto config = EdgeConfig::fromLoader(loader);
    REQUIRE(config.trustedProxies.size() == 2);
    REQUIRE(config.peerIpHeaderName == std::string("CF-Connecting-IP"));
    REQUIRE(config.proxyMode);
    REQUIRE(config.log.level == std::string("debug"));
    REQUIRE(config.log.format == std::string("%L %m"));
    REQUIRE_FALSE(config.log.file);
  }

  SECTION("Array list")
  {
    auto loader = ConfigLoader::fromString("[proxy]\n"
                                           "trusted_proxies = [\"10.0.0.0/8\", \"fd00::/8\"]\n");
    auto config = EdgeConfig::fromLoader(loader);
    REQUIRE(config.trustedProxies.size() == 2);
    REQUIRE(config.trustedProxies.isTrusted(ip("fd00::1")));
    REQUIRE_FALSE(config.proxyMode);
  }

  SECTION("Environment overrides the file")
  {
    ScopedEnv proxies("TRUSTED_PROXIES", std::string("203.0.113.0/24"));
    ScopedEnv mode("PROXY_MODE", std::string("false"));
    auto loader = ConfigLoader::fromString("[proxy]\n"
                                           "trusted_proxies = [\"10.0.0.0/8\"]\n"
                                           "proxy_mode = true\n");
    auto config = EdgeConfig::fromLoader(loader);
    REQUIRE(config.trustedProxies.isTrusted(ip("203.0.113.7")));
    REQUIRE_FALSE(config.trustedProxies.isTrusted(ip("10.0.0.1")));
    REQUIRE_FALSE(config.proxyMode);
  }

  SECTION("Wrong value types")
  {
    REQUIRE_THROWS_AS(
      EdgeConfig::fromLoader(ConfigLoader::fromString("[proxy]\ntrusted_proxies = 5\n")),
      ConfigError);
    REQUIRE_THROWS_AS(
      EdgeConfig::fromLoader(ConfigLoader::fromString("[proxy]\nproxy_mode = \"yes\"\n")),
      ConfigError);
    REQUIRE_THROWS_AS(
      EdgeConfig::fromLoader(ConfigLoader::fromString("[proxy]\npeer_ip_header = 1\n")),
      ConfigError);
  }

  SECTION("From a file")
  {
    TempFile file("edgeguard_test_edge.toml", "[proxy]\ntrusted_proxies = \"10.0.0.0/8\"\n");
    auto config = EdgeConfig::fromFile(file.path());
    REQUIRE(config.trustedProxies.size() == 1);
    REQUIRE_THROWS_AS(EdgeConfig::fromFile("/nonexistent/edgeguard.toml"), ConfigError);
  }
}

TEST_CASE("Logging setup from configuration", "[edgeconfig][logging]")
{
  EdgeConfig config;

  SECTION("Unknown level is rejected")
  {
    config.log.level = "loud";
    REQUIRE_THROWS_AS(config.applyLogging(), ConfigError);
  }

  SECTION("Level and format are applied")
  {
    auto previousFormat = Logger::getLogFormat();
    config.log.level = "warning";
    config.log.format = "<%L> %m";
    config.applyLogging();
    REQUIRE(Logger::getLevel() == Logger::Level::Warning);
    REQUIRE(Logger::getLogFormat() == "<%L> %m");

    Logger::setLogFormat(previousFormat);
    Logger::setLevel(Logger::Level::Info);
  }
}

TEST_CASE("Process-wide configuration is published once", "[edgeconfig][service]")
{
  REQUIRE_FALSE(EdgeService::initialized());
  REQUIRE_THROWS_AS(EdgeService::config(), std::runtime_error);

  EdgeConfig config;
  config.trustedProxies = edgeguard::network::ProxyTrustList::build("10.0.0.0/8");
  EdgeService::init(config);

  REQUIRE(EdgeService::initialized());
  REQUIRE(EdgeService::config().trustedProxies.isTrusted(ip("10.1.2.3")));

  EdgeConfig other;
  REQUIRE_THROWS_AS(EdgeService::init(other), std::runtime_error);
  REQUIRE(EdgeService::config().trustedProxies.size() == 1);
}
