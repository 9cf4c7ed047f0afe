// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <fstream>
#include <sstream>

using edgeguard::core::Logger;
using edgeguard::test::LogCapture;
using edgeguard::test::TempFile;

TEST_CASE("Level names", "[logger][levels]")
{
  REQUIRE(Logger::parseLevel("trace") == Logger::Level::Trace);
  REQUIRE(Logger::parseLevel("DEBUG") == Logger::Level::Debug);
  REQUIRE(Logger::parseLevel("Info") == Logger::Level::Info);
  REQUIRE(Logger::parseLevel("warn") == Logger::Level::Warning);
  REQUIRE(Logger::parseLevel("warning") == Logger::Level::Warning);
  REQUIRE(Logger::parseLevel("error") == Logger::Level::Error);
  REQUIRE(Logger::parseLevel("fatal") == Logger::Level::Fatal);
  REQUIRE_FALSE(Logger::parseLevel("verbose"));
  REQUIRE_FALSE(Logger::parseLevel(""));

  REQUIRE(std::string(Logger::levelToString(Logger::Level::Warning)) == "WARN");
  REQUIRE(std::string(Logger::levelToString(Logger::Level::Trace)) == "TRACE");
}

TEST_CASE("External handler and level filtering", "[logger][external]")
{
  SECTION("Handler receives formatted and raw text")
  {
    LogCapture capture(Logger::Level::Debug);
    Logger::info("Test info message");
    Logger::warning("Test warning message");
    Logger::trace("filtered");

    const auto &entries = capture.entries();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].level == Logger::Level::Info);
    REQUIRE(entries[0].rawMessage == "Test info message");
    REQUIRE(entries[0].formattedMessage.find("[INFO]") != std::string::npos);
    REQUIRE(entries[0].formattedMessage.find("Test info message") != std::string::npos);
    REQUIRE(entries[1].level == Logger::Level::Warning);
  }

  SECTION("Minimum level applies")
  {
    LogCapture capture(Logger::Level::Error);
    Logger::debug("no");
    Logger::info("no");
    Logger::warning("no");
    Logger::error("yes");
    Logger::fatal("yes");
    REQUIRE(capture.entries().size() == 2);
    REQUIRE(capture.count(Logger::Level::Error) == 1);
    REQUIRE(capture.count(Logger::Level::Fatal) == 1);
  }

  SECTION("Handler is removed with the capture")
  {
    {
      LogCapture capture;
      Logger::info("captured");
      REQUIRE(capture.contains(Logger::Level::Info, "captured"));
    }
    LogCapture second;
    REQUIRE(second.entries().empty());
  }
}

TEST_CASE("Stream macros", "[logger][macros]")
{
  LogCapture capture;
  int port = 8080;
  EDGEGUARD_LOG_TRACE("trace " << port);
  EDGEGUARD_LOG_DEBUG("debug " << port);
  EDGEGUARD_LOG_INFO("info " << port);
  EDGEGUARD_LOG_WARN("warn " << port);
  EDGEGUARD_LOG_ERROR("error " << port);
  EDGEGUARD_LOG_FATAL("fatal " << port);

  const auto &entries = capture.entries();
  REQUIRE(entries.size() == 6);
  REQUIRE(entries[0].rawMessage == "trace 8080");
  REQUIRE(entries[3].level == Logger::Level::Warning);
  REQUIRE(entries[5].rawMessage == "fatal 8080");
}

TEST_CASE("Custom line format", "[logger][format]")
{
  auto previous = Logger::getLogFormat();
  LogCapture capture;

  SECTION("Level, message and source file")
  {
    Logger::setLogFormat("[%L] %m (%F)");
    EDGEGUARD_LOG_WARN("disk low");
    REQUIRE(capture.entries().size() == 1);
    REQUIRE(capture.entries()[0].formattedMessage ==
            "[WARN] disk low (edgeguard_test_logger.cpp)\n");
  }

  SECTION("Literal percent and unknown placeholders")
  {
    Logger::setLogFormat("%m 100%% %q");
    Logger::info("load");
    REQUIRE(capture.entries()[0].formattedMessage == "load 100% %q\n");
  }

  SECTION("Empty format is ignored")
  {
    Logger::setLogFormat("%m");
    Logger::setLogFormat("");
    REQUIRE(Logger::getLogFormat() == "%m");
  }

  Logger::setLogFormat(previous);
}

TEST_CASE("File sink", "[logger][file]")
{
  TempFile file("edgeguard_test_logger.log", "");
  auto previous = Logger::getLogFormat();
  Logger::setLogFormat("%L %m");
  Logger::init(Logger::Level::Debug, file.path());

  Logger::debug("written to file");
  Logger::trace("not written");
  Logger::flush();

  Logger::init(Logger::Level::Info, "");
  Logger::setLogFormat(previous);

  std::ifstream in(file.path());
  std::stringstream content;
  content << in.rdbuf();
  REQUIRE(content.str() == "DEBUG written to file\n");
}
