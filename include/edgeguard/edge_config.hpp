// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <edgeguard/core/config_loader.hpp>
#include <edgeguard/core/logger.hpp>
#include <edgeguard/network/trusted_proxies.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace edgeguard
{

/// \brief Process-wide settings of the trust boundary, read once at startup.
///
/// Configuration sources, later ones winning:
///   1. a TOML file (see fromFile()), if given
///   2. the environment: TRUSTED_PROXIES, PEER_IP_HEADER_NAME, PROXY_MODE
///
/// Example:
/// \code
/// [proxy]
/// trusted_proxies = """
/// 10.0.0.0/8
/// 192.168.0.0/16
/// """
/// peer_ip_header = "X-Real-IP"
/// proxy_mode = true
///
/// [log]
/// level = "info"
/// \endcode
struct EdgeConfig
{
  struct LogConfig
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
    std::optional<std::string> format;
    std::optional<std::string> timeFormat;
  };

  network::ProxyTrustList trustedProxies;
  std::optional<std::string> peerIpHeaderName;
  bool proxyMode{false};
  LogConfig log;

  /// \brief Build from the environment only.
  /// \throws core::ConfigError if TRUSTED_PROXIES is not set or PROXY_MODE
  /// is not a boolean
  static EdgeConfig fromEnvironment()
  {
    if (!readEnv("TRUSTED_PROXIES"))
    {
      throw core::ConfigError("TRUSTED_PROXIES is not set");
    }
    EdgeConfig config;
    config.applyEnvironment();
    return config;
  }

  /// \brief Build from a TOML file, then apply environment overrides.
  /// \throws core::ConfigError if the file is missing, malformed or has
  /// values of the wrong type
  static EdgeConfig fromFile(const std::string &path)
  {
    core::ConfigLoader loader(path);
    return fromLoader(loader);
  }

  /// \brief Build from an already loaded configuration, then apply
  /// environment overrides.
  static EdgeConfig fromLoader(const core::ConfigLoader &loader)
  {
    EdgeConfig config;
    const auto &table = loader.table();

    auto proxies = table.at_path("proxy.trusted_proxies");
    if (proxies.is_string())
    {
      config.trustedProxies = network::ProxyTrustList::build(*proxies.as<std::string>());
    }
    else if (proxies.is_array())
    {
      auto entries = loader.getStringArray("proxy.trusted_proxies");
      config.trustedProxies = network::ProxyTrustList::fromEntries(*entries);
    }
    else if (proxies)
    {
      throw core::ConfigError(
        "proxy.trusted_proxies must be a string or an array of strings");
    }

    config.peerIpHeaderName = nonEmpty(stringAt(loader, "proxy.peer_ip_header"));

    auto proxyMode = table.at_path("proxy.proxy_mode");
    if (proxyMode)
    {
      if (!proxyMode.is_boolean())
      {
        throw core::ConfigError("proxy.proxy_mode must be a boolean");
      }
      config.proxyMode = *proxyMode.as<bool>();
    }

    config.log.level = stringAt(loader, "log.level");
    config.log.file = stringAt(loader, "log.file");
    config.log.format = stringAt(loader, "log.format");
    config.log.timeFormat = stringAt(loader, "log.time_format");

    config.applyEnvironment();
    return config;
  }

  /// \brief Overlay TRUSTED_PROXIES, PEER_IP_HEADER_NAME and PROXY_MODE.
  /// \throws core::ConfigError if PROXY_MODE is not a boolean
  void applyEnvironment()
  {
    if (auto raw = readEnv("TRUSTED_PROXIES"))
    {
      trustedProxies = network::ProxyTrustList::build(*raw);
    }
    if (auto header = readEnv("PEER_IP_HEADER_NAME"))
    {
      peerIpHeaderName = nonEmpty(header);
    }
    if (auto mode = readEnv("PROXY_MODE"))
    {
      auto parsed = parseBool(*mode);
      if (!parsed)
      {
        throw core::ConfigError("PROXY_MODE must be true, false, 1 or 0, got '" + *mode + "'");
      }
      proxyMode = *parsed;
    }
  }

  /// \brief Initialize the process logger from the [log] section.
  /// \throws core::ConfigError on an unknown log level
  void applyLogging() const
  {
    const char *DEFAULT_LOG_LEVEL = "info";
    const char *DEFAULT_LOG_FILE = "";
    const char *DEFAULT_LOG_TIME_FORMAT = "%Y-%m-%d %H:%M:%S";

    std::string levelName = log.level.value_or(DEFAULT_LOG_LEVEL);
    auto level = core::Logger::parseLevel(levelName);
    if (!level)
    {
      throw core::ConfigError("Unknown log level: " + levelName);
    }
    core::Logger::init(*level, log.file.value_or(DEFAULT_LOG_FILE),
                       log.timeFormat.value_or(DEFAULT_LOG_TIME_FORMAT));
    if (log.format)
    {
      core::Logger::setLogFormat(*log.format);
    }

    EDGEGUARD_LOG_DEBUG("applyLogging: log.level = " << levelName);
    EDGEGUARD_LOG_DEBUG("applyLogging: log.file = " << log.file.value_or("<unset>"));
    EDGEGUARD_LOG_DEBUG("applyLogging: proxy.trusted_proxies = [" << trustedProxies.toString()
                                                                   << "]");
    EDGEGUARD_LOG_DEBUG("applyLogging: proxy.peer_ip_header = "
                        << peerIpHeaderName.value_or("<unset>"));
    EDGEGUARD_LOG_DEBUG("applyLogging: proxy.proxy_mode = " << (proxyMode ? "true" : "false"));
  }

  /// \brief Accepts true/false/1/0 in any case.
  static std::optional<bool> parseBool(const std::string &text)
  {
    std::string v = util::trim(text);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1")
    {
      return true;
    }
    if (v == "false" || v == "0")
    {
      return false;
    }
    return std::nullopt;
  }

private:
  static std::optional<std::string> readEnv(const char *name)
  {
    const char *value = std::getenv(name);
    if (!value)
    {
      return std::nullopt;
    }
    return std::string(value);
  }

  static std::optional<std::string> nonEmpty(const std::optional<std::string> &value)
  {
    if (!value)
    {
      return std::nullopt;
    }
    std::string trimmed = util::trim(*value);
    if (trimmed.empty())
    {
      return std::nullopt;
    }
    return trimmed;
  }

  static std::optional<std::string> stringAt(const core::ConfigLoader &loader,
                                             const std::string &key)
  {
    auto node = loader.table().at_path(key);
    if (!node)
    {
      return std::nullopt;
    }
    if (!node.is_string())
    {
      throw core::ConfigError(key + " must be a string");
    }
    return node.as<std::string>();
  }
};

/// \brief Optional process-wide holder for a single EdgeConfig.
///
/// The configuration is published exactly once; every later reader sees the
/// fully built value.
class EdgeService
{
public:
  /// \brief Publish \p config as the process configuration.
  /// \throws std::runtime_error if already initialized
  static void init(EdgeConfig config)
  {
    bool first = false;
    std::call_once(onceFlag(),
                   [&]()
                   {
                     holder() = std::make_unique<const EdgeConfig>(std::move(config));
                     first = true;
                   });
    if (!first)
    {
      throw std::runtime_error("EdgeService already initialized");
    }
    EDGEGUARD_LOG_INFO("EdgeService: initialized with " << holder()->trustedProxies.size()
                                                        << " trusted proxy range(s)");
  }

  static bool initialized() { return holder() != nullptr; }

  /// \brief Shared configuration.
  /// \throws std::runtime_error if init() has not been called
  static const EdgeConfig &config()
  {
    if (!holder())
    {
      throw std::runtime_error("EdgeService not initialized");
    }
    return *holder();
  }

private:
  static std::once_flag &onceFlag()
  {
    static std::once_flag flag;
    return flag;
  }

  static std::unique_ptr<const EdgeConfig> &holder()
  {
    static std::unique_ptr<const EdgeConfig> instance;
    return instance;
  }
};

} // namespace edgeguard
