// Copyright (C) 2022 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "utils/Logging.hh"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if SPDLOG_VERSION >= 10801
#  include <spdlog/cfg/env.h>
#endif

using namespace trustgate::utils;

std::shared_ptr<spdlog::logger>
Logging::create(std::string domain)
{
  return spdlog::default_logger()->clone(domain);
}

void
Logging::init_console(spdlog::level::level_enum level, std::optional<spdlog::level::level_enum> override_level)
{
  // stdout carries the report, diagnostics go to stderr.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

  auto logger{std::make_shared<spdlog::logger>("trustgate", spdlog::sink_ptr{console_sink})};
  logger->flush_on(spdlog::level::err);
  spdlog::set_default_logger(logger);

  spdlog::set_level(level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%-5l%$] %v");

#if SPDLOG_VERSION >= 10801
  spdlog::cfg::load_env_levels();
#endif

  if (override_level)
    {
      spdlog::set_level(*override_level);
    }
}

std::optional<spdlog::level::level_enum>
Logging::parse_level(const std::string &name)
{
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off")
    {
      return {};
    }
  return level;
}
