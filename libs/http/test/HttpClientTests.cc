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

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#if SPDLOG_VERSION >= 10801
#  include <spdlog/cfg/env.h>
#endif

#include "http/HttpClient.hh"
#include "http/HttpClientErrors.hh"
#include "http/Options.hh"
#include "utils/Logging.hh"

#include "TestServer.hh"

#define BOOST_TEST_MODULE "trustgate-http"
#include <boost/test/unit_test.hpp>

using namespace trustgate::http;
using namespace trustgate::utils;

struct GlobalFixture
{
  GlobalFixture() = default;
  ~GlobalFixture() = default;

  GlobalFixture(const GlobalFixture &) = delete;
  GlobalFixture &operator=(const GlobalFixture &) = delete;
  GlobalFixture(GlobalFixture &&) = delete;
  GlobalFixture &operator=(GlobalFixture &&) = delete;

  void setup()
  {
    const auto *log_file = "trustgate-test-http.log";

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    auto logger{std::make_shared<spdlog::logger>("trustgate", std::initializer_list<spdlog::sink_ptr>{file_sink, console_sink})};
    logger->flush_on(spdlog::level::critical);
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%-5l%$] %v");

#if SPDLOG_VERSION >= 10801
    spdlog::cfg::load_env_levels();
#endif
  }
};

struct Fixture
{
  Fixture() = default;
  ~Fixture() = default;

  Fixture(const Fixture &) = delete;
  Fixture &operator=(const Fixture &) = delete;
  Fixture(Fixture &&) = delete;
  Fixture &operator=(Fixture &&) = delete;

  outcome::std_result<Response> get_sync(std::shared_ptr<HttpClient> http, std::string url, Headers headers = {})
  {
    boost::asio::io_context ioc;
    outcome::std_result<Response> ret = outcome::failure(HttpClientErrc::InternalError);

    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> { ret = co_await http->get(url, headers); },
      boost::asio::detached);
    ioc.run();
    return ret;
  }
};

BOOST_TEST_GLOBAL_FIXTURE(GlobalFixture);

BOOST_FIXTURE_TEST_SUITE(trustgate_http_test, Fixture)

BOOST_AUTO_TEST_CASE(http_client_get_plain)
{
  TestServer server;
  server.add("/v2/repositories/library/nginx/", R"({"pull_count": 10})");
  server.run();

  auto http = std::make_shared<HttpClient>();

  auto rc = get_sync(http, "http://127.0.0.1:1337/v2/repositories/library/nginx/");

  BOOST_CHECK_EQUAL(rc.has_error(), false);
  if (!rc.has_error())
    {
      auto [result, content] = rc.value();
      BOOST_CHECK_EQUAL(result, 200);
      BOOST_CHECK_EQUAL(content, R"({"pull_count": 10})");
    }

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_sends_request_headers)
{
  TestServer server;
  server.run();

  auto http = std::make_shared<HttpClient>();
  http->options().set_user_agent("trustgate-test");

  auto rc = get_sync(http,
                     "http://127.0.0.1:1337/echo-headers",
                     {{"Accept", "application/vnd.github+json"}, {"Authorization", "Bearer abc"}});

  BOOST_CHECK_EQUAL(rc.has_error(), false);
  if (!rc.has_error())
    {
      auto [result, content] = rc.value();
      BOOST_CHECK_EQUAL(result, 200);
      BOOST_CHECK(content.find("Accept: application/vnd.github+json") != std::string::npos);
      BOOST_CHECK(content.find("Authorization: Bearer abc") != std::string::npos);
      BOOST_CHECK(content.find("User-Agent: trustgate-test") != std::string::npos);
    }

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_not_found)
{
  TestServer server;
  server.add("/foo", "foo\n");
  server.run();

  auto http = std::make_shared<HttpClient>();

  auto rc = get_sync(http, "http://127.0.0.1:1337/bar");

  BOOST_CHECK_EQUAL(rc.has_error(), false);
  if (!rc.has_error())
    {
      auto [result, content] = rc.value();
      BOOST_CHECK_EQUAL(result, 404);
      BOOST_CHECK_EQUAL(content, "The resource '/bar' was not found.");
    }
  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_host_not_found)
{
  auto http = std::make_shared<HttpClient>();

  auto rc = get_sync(http, "https://does-not-exist.invalid:1337/bar");
  BOOST_CHECK(rc.error() == HttpClientErrc::NameResolutionFailed);
}

BOOST_AUTO_TEST_CASE(http_client_connection_refused)
{
  auto http = std::make_shared<HttpClient>();

  auto rc = get_sync(http, "http://127.0.0.1:1338/bar");
  BOOST_CHECK(rc.error() == HttpClientErrc::ConnectionRefused);
}

BOOST_AUTO_TEST_CASE(http_client_invalid_url)
{
  auto http = std::make_shared<HttpClient>();

  auto rc = get_sync(http, "https:/127.0.0.1:1337/bar");
  BOOST_CHECK(rc.error() == HttpClientErrc::MalformedURL);
}

BOOST_AUTO_TEST_CASE(http_client_unsupported_scheme)
{
  auto http = std::make_shared<HttpClient>();

  auto rc = get_sync(http, "ftp://127.0.0.1/bar");
  BOOST_CHECK(rc.error() == HttpClientErrc::MalformedURL);
}

BOOST_AUTO_TEST_CASE(http_client_redirect_same_server)
{
  TestServer server;
  server.add("/api/v1/repository/coreos/etcd", R"({"is_public": true})");
  server.add_redirect("/api/v1/repository/coreos/old", "/api/v1/repository/coreos/etcd");
  server.run();

  auto http = std::make_shared<HttpClient>();

  auto rc = get_sync(http, "http://127.0.0.1:1337/api/v1/repository/coreos/old");

  BOOST_CHECK_EQUAL(rc.has_error(), false);
  if (!rc.has_error())
    {
      auto [result, content] = rc.value();
      BOOST_CHECK_EQUAL(result, 200);
      BOOST_CHECK_EQUAL(content, R"({"is_public": true})");
    }
  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_redirect_exceed_max)
{
  TestServer server;
  server.add_redirect("/a", "/b");
  server.add_redirect("/b", "/a");
  server.run();

  auto http = std::make_shared<HttpClient>();
  http->options().set_max_redirects(3);

  auto rc = get_sync(http, "http://127.0.0.1:1337/a");
  BOOST_CHECK(rc.error() == HttpClientErrc::TooManyRedirects);
  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_redirect_disabled)
{
  TestServer server;
  server.add_redirect("/a", "/b");
  server.run();

  auto http = std::make_shared<HttpClient>();
  http->options().set_follow_redirects(false);

  auto rc = get_sync(http, "http://127.0.0.1:1337/a");

  BOOST_CHECK_EQUAL(rc.has_error(), false);
  if (!rc.has_error())
    {
      BOOST_CHECK_EQUAL(rc.value().first, 302);
    }
  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_timeout)
{
  TestServer server;
  server.add("/slow", "{}");
  server.add_delay("/slow", std::chrono::milliseconds(3000));
  server.run();

  auto http = std::make_shared<HttpClient>();
  http->options().set_timeout(std::chrono::seconds(1));

  auto rc = get_sync(http, "http://127.0.0.1:1337/slow");
  BOOST_CHECK(rc.error() == HttpClientErrc::Timeout);
  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_timeout_covers_redirects)
{
  TestServer server;
  server.add_redirect("/hop1", "/hop2");
  server.add_redirect("/hop2", "/hop3");
  server.add("/hop3", "{}");
  server.add_delay("/hop1", std::chrono::milliseconds(600));
  server.add_delay("/hop2", std::chrono::milliseconds(600));
  server.add_delay("/hop3", std::chrono::milliseconds(600));
  server.run();

  auto http = std::make_shared<HttpClient>();
  http->options().set_timeout(std::chrono::seconds(1));

  auto start = std::chrono::steady_clock::now();
  auto rc = get_sync(http, "http://127.0.0.1:1337/hop1");
  auto elapsed = std::chrono::steady_clock::now() - start;

  BOOST_CHECK(rc.has_error());
  if (rc.has_error())
    {
      BOOST_CHECK(rc.error() == HttpClientErrc::Timeout);
    }
  BOOST_CHECK(elapsed < std::chrono::milliseconds(1700));
  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_error_messages)
{
  BOOST_CHECK_EQUAL(std::error_code(HttpClientErrc::Timeout).category().name(), std::string("httpclient"));
  BOOST_CHECK_EQUAL(std::error_code(HttpClientErrc::Timeout).message(), "request timed out");
  BOOST_CHECK_EQUAL(std::error_code(HttpClientErrc::MalformedURL).message(), "malformed URL");
}

BOOST_AUTO_TEST_SUITE_END()
