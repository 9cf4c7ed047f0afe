// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <edgeguard/edgeguard.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace
{
  constexpr int EXIT_REJECTED = 2;

  struct CliOptions
  {
    std::optional<std::string> configFile;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    std::optional<std::string> logFormat;
    std::string command;
    std::optional<std::string> peer;
    std::vector<std::string> headers;
    std::vector<std::string> positional;
  };

  /// \brief Print help message
  void printHelp()
  {
    std::cout
      << "Usage: edgeguard [options] <command> [args]\n"
      << "\n"
      << "Commands:\n"
      << "  resolve [--peer ADDR] [--header \"Name: value\"]...\n"
      << "                                   Resolve the client IP of a request\n"
      << "  claims TOKEN                     Print the unverified claims of a token\n"
      << "  check-proxy ADDR                 Tell whether ADDR is a trusted proxy\n"
      << "  store-id                         Print a new random store id\n"
      << "  hostname                         Print the local host name\n"
      << "\n"
      << "Options:\n"
      << "  -h, --help                       Show this help message\n"
      << "  -c, --config <file>              Configuration file path (default: environment)\n"
      << "  -l, --log-level <level>          Log level (trace, debug, info, warning, error, "
         "fatal)\n"
      << "  -f, --log-file <file>            Log file path\n"
      << "      --log-format <format>        Log line format\n";
  }

  /// \brief Parse command-line arguments
  CliOptions parseCliArgs(int argc, char **argv)
  {
    CliOptions opts;
    for (int i = 1; i < argc; ++i)
    {
      std::string arg = argv[i];
      if ((arg == "-c" || arg == "--config") && i + 1 < argc)
      {
        opts.configFile = argv[++i];
      }
      else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
      {
        opts.logLevel = argv[++i];
      }
      else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
      {
        opts.logFile = argv[++i];
      }
      else if (arg == "--log-format" && i + 1 < argc)
      {
        opts.logFormat = argv[++i];
      }
      else if (arg == "--peer" && i + 1 < argc)
      {
        opts.peer = argv[++i];
      }
      else if (arg == "--header" && i + 1 < argc)
      {
        opts.headers.push_back(argv[++i]);
      }
      else if (arg == "-h" || arg == "--help")
      {
        printHelp();
        std::exit(0);
      }
      else if (arg.length() > 0 && arg[0] == '-')
      {
        throw std::runtime_error("Unknown option: " + arg);
      }
      else if (opts.command.empty())
      {
        opts.command = arg;
      }
      else
      {
        opts.positional.push_back(arg);
      }
    }
    if (opts.command.empty())
    {
      throw std::runtime_error("No command given (try --help)");
    }
    if (opts.command != "resolve" && opts.command != "claims" && opts.command != "check-proxy" &&
        opts.command != "store-id" && opts.command != "hostname")
    {
      throw std::runtime_error("Unknown command: " + opts.command);
    }
    return opts;
  }

  void applyLogOptions(const CliOptions &opts, edgeguard::EdgeConfig &config)
  {
    if (opts.logLevel)
    {
      config.log.level = opts.logLevel;
    }
    if (opts.logFile)
    {
      config.log.file = opts.logFile;
    }
    if (opts.logFormat)
    {
      config.log.format = opts.logFormat;
    }
  }

  edgeguard::EdgeConfig loadConfig(const CliOptions &opts)
  {
    edgeguard::EdgeConfig config = opts.configFile
                                     ? edgeguard::EdgeConfig::fromFile(*opts.configFile)
                                     : edgeguard::EdgeConfig::fromEnvironment();
    applyLogOptions(opts, config);
    return config;
  }

  const std::string &requirePositional(const CliOptions &opts, const char *what)
  {
    if (opts.positional.size() != 1)
    {
      throw std::runtime_error(opts.command + " expects exactly one " + what);
    }
    return opts.positional.front();
  }

  int runResolve(const CliOptions &opts)
  {
    edgeguard::network::ServerRequest request;
    request.remote_addr = opts.peer.value_or("");
    for (const auto &header : opts.headers)
    {
      auto kv = edgeguard::util::splitOnce(header, ':');
      if (!kv)
      {
        throw std::runtime_error("Invalid header (expected \"Name: value\"): " + header);
      }
      edgeguard::network::appendHeader(request.headers, edgeguard::util::trim(kv->first),
                                       edgeguard::util::trim(kv->second));
    }

    edgeguard::network::ClientIpResolver resolver(edgeguard::EdgeService::config());
    auto result = resolver.resolve(edgeguard::network::ServerRequestView(request));
    if (!result.ok)
    {
      std::cout << "rejected: " << result.code << " (" << edgeguard::toHttpStatus(result.code)
                << ")" << std::endl;
      return EXIT_REJECTED;
    }
    std::cout << *result.ip << std::endl;
    return 0;
  }

  int runClaims(const CliOptions &opts)
  {
    const std::string &token = requirePositional(opts, "token");
    auto result = edgeguard::auth::extractUnverifiedClaims<edgeguard::core::Json>(token);
    if (!result.ok)
    {
      std::cout << "rejected: " << result.code << " (" << edgeguard::toHttpStatus(result.code)
                << ")" << std::endl;
      return EXIT_REJECTED;
    }
    std::cout << result.claims->dump(2) << std::endl;
    return 0;
  }

  int runCheckProxy(const CliOptions &opts)
  {
    const std::string &text = requirePositional(opts, "address");
    auto ip = edgeguard::network::IpAddress::parse(text);
    if (!ip)
    {
      throw std::runtime_error("Not an IP address: " + text);
    }
    if (edgeguard::EdgeService::config().trustedProxies.isTrusted(*ip))
    {
      std::cout << "trusted" << std::endl;
      return 0;
    }
    std::cout << "untrusted" << std::endl;
    return EXIT_REJECTED;
  }
} // namespace

int main(int argc, char **argv)
{
  try
  {
    CliOptions opts = parseCliArgs(argc, argv);

    if (opts.command == "store-id")
    {
      std::cout << edgeguard::crypto::newStoreId() << std::endl;
      return 0;
    }
    if (opts.command == "hostname")
    {
      std::cout << edgeguard::system::localHostname() << std::endl;
      return 0;
    }
    if (opts.command == "claims")
    {
      // Token inspection needs no proxy configuration
      edgeguard::EdgeConfig config;
      applyLogOptions(opts, config);
      config.applyLogging();
      return runClaims(opts);
    }

    edgeguard::EdgeConfig config = loadConfig(opts);
    config.applyLogging();
    edgeguard::EdgeService::init(std::move(config));

    if (opts.command == "resolve")
    {
      return runResolve(opts);
    }
    return runCheckProxy(opts);
  }
  catch (const std::exception &ex)
  {
    std::cerr << "edgeguard: " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }
}
