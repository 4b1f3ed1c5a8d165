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

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/cfg/env.h>

#include "trustgate/TrustGateErrors.hh"
#include "http/HttpClientErrors.hh"
#include "ToolErrors.hh"

class GlobalFixture : public ::testing::Environment
{
public:
  void SetUp() override
  {
    const auto *log_file = "trustgate-test.log";

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    auto logger{std::make_shared<spdlog::logger>("trustgate", std::initializer_list<spdlog::sink_ptr>{file_sink, console_sink})};
    logger->flush_on(spdlog::level::critical);
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%-5l%$] %v");

    spdlog::cfg::load_env_levels();
  }

  void TearDown() override
  {
    spdlog::drop_all();
  }
};

::testing::Environment *const global_env = ::testing::AddGlobalTestEnvironment(new GlobalFixture);

TEST(TrustGate, trustgate_error_code)
{
  auto error = trustgate::make_error_code(trustgate::TrustGateErrc::InternalError);
  EXPECT_EQ(error.message(), "internal error");
  EXPECT_STREQ(error.category().name(), "trustgate");

  error = trustgate::make_error_code(trustgate::TrustGateErrc::InvalidArgument);
  EXPECT_EQ(error.message(), "invalid argument");
  EXPECT_STREQ(error.category().name(), "trustgate");

  error = trustgate::make_error_code(trustgate::TrustGateErrc::InvalidConfiguration);
  EXPECT_EQ(error.message(), "invalid configuration");
  EXPECT_STREQ(error.category().name(), "trustgate");

  error = trustgate::make_error_code(trustgate::TrustGateErrc::EvaluationCancelled);
  EXPECT_EQ(error.message(), "evaluation cancelled");
  EXPECT_STREQ(error.category().name(), "trustgate");

  error = trustgate::make_error_code(trustgate::TrustGateErrc::Success);
  EXPECT_EQ(error.message(), "success");
  EXPECT_STREQ(error.category().name(), "trustgate");
}

TEST(TrustGate, tool_error_code)
{
  auto error = make_error_code(ToolErrc::NotFound);
  EXPECT_EQ(error.message(), "tool not found");
  EXPECT_STREQ(error.category().name(), "trustgate-tool");

  error = make_error_code(ToolErrc::LaunchFailed);
  EXPECT_EQ(error.message(), "failed to launch tool");
  EXPECT_STREQ(error.category().name(), "trustgate-tool");

  error = make_error_code(ToolErrc::Timeout);
  EXPECT_EQ(error.message(), "tool timed out");
  EXPECT_STREQ(error.category().name(), "trustgate-tool");

  error = make_error_code(ToolErrc::Failed);
  EXPECT_EQ(error.message(), "tool failed");
  EXPECT_STREQ(error.category().name(), "trustgate-tool");

  error = make_error_code(ToolErrc::InvalidOutput);
  EXPECT_EQ(error.message(), "invalid tool output");
  EXPECT_STREQ(error.category().name(), "trustgate-tool");

  error = make_error_code(ToolErrc::Success);
  EXPECT_EQ(error.message(), "success");
  EXPECT_STREQ(error.category().name(), "trustgate-tool");
}

TEST(TrustGate, http_error_code)
{
  auto error = trustgate::http::make_error_code(trustgate::http::HttpClientErrc::Timeout);
  EXPECT_EQ(error.message(), "request timed out");
  EXPECT_STREQ(error.category().name(), "httpclient");

  error = trustgate::http::make_error_code(trustgate::http::HttpClientErrc::MalformedURL);
  EXPECT_EQ(error.message(), "malformed URL");
  EXPECT_STREQ(error.category().name(), "httpclient");
}

TEST(TrustGate, error_codes_compare_by_category)
{
  std::error_code tool_error = ToolErrc::Timeout;
  std::error_code http_error = trustgate::http::HttpClientErrc::Timeout;

  EXPECT_EQ(tool_error, ToolErrc::Timeout);
  EXPECT_NE(http_error, ToolErrc::Timeout);
  EXPECT_NE(tool_error, http_error);
}
