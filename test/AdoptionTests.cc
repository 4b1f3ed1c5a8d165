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

#include <optional>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include "trustgate/ImageReference.hh"
#include "trustgate/Report.hh"
#include "http/HttpClientErrors.hh"

#include "AdoptionEvaluator.hh"
#include "AdoptionStrategies.hh"
#include "HttpClientMock.hh"
#include "TestBase.hh"

using ::testing::_;
using ::testing::Eq;
using ::testing::InvokeWithoutArgs;

using trustgate::Criterion;
using trustgate::http::Headers;
using trustgate::http::Response;

namespace
{
  auto respond(int status, std::string body)
  {
    return InvokeWithoutArgs([status, body]() { return awaitable_value<outcome::std_result<Response>>(Response{status, body}); });
  }

  auto fail(trustgate::http::HttpClientErrc error)
  {
    return InvokeWithoutArgs([error]() { return awaitable_value<outcome::std_result<Response>>(error); });
  }

  trustgate::EvaluatorResult assess(AdoptionStrategy &strategy, const std::string &reference)
  {
    auto image = trustgate::parse_image_reference(reference);

    std::optional<trustgate::EvaluatorResult> result;
    boost::asio::io_context ioc;
    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> {
        try
          {
            result.emplace(co_await strategy.assess(image));
          }
        catch (std::exception &e)
          {
            spdlog::info("Exception {}", e.what());
            EXPECT_TRUE(false);
          }
      },
      boost::asio::detached);
    ioc.run();

    EXPECT_TRUE(result.has_value());
    return result.value_or(trustgate::EvaluatorResult(Criterion::Adoption, 0, ""));
  }
} // namespace

TEST(DockerHubAdoption, highly_adopted)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(Eq("https://hub.docker.com/v2/repositories/bitnami/redis/"), _))
    .WillOnce(respond(200, R"({"pull_count": 2500000, "star_count": 42})"));

  DockerHubAdoption strategy(http);
  auto result = assess(strategy, "bitnami/redis:7");
  EXPECT_EQ(result.criterion(), Criterion::Adoption);
  EXPECT_EQ(result.points(), 15);
  EXPECT_EQ(result.detail(), "Docker Hub: 2500000 pulls, 42 stars (highly adopted)");
}

TEST(DockerHubAdoption, official_image_uses_library_namespace)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(Eq("https://hub.docker.com/v2/repositories/library/nginx/"), _))
    .WillOnce(respond(200, R"({"pull_count": 150000, "star_count": 3})"));

  DockerHubAdoption strategy(http);
  auto result = assess(strategy, "nginx:1.25");
  EXPECT_EQ(result.points(), 10);
  EXPECT_EQ(result.detail(), "Docker Hub: 150000 pulls, 3 stars (well adopted)");
}

TEST(DockerHubAdoption, explicit_registry_official_image_uses_library_namespace)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(Eq("https://hub.docker.com/v2/repositories/library/nginx/"), _))
    .WillOnce(respond(200, R"({"pull_count": 150000, "star_count": 3})"));

  DockerHubAdoption strategy(http);
  auto result = assess(strategy, "docker.io/nginx:1.25");
  EXPECT_EQ(result.points(), 10);
  EXPECT_EQ(result.detail(), "Docker Hub: 150000 pulls, 3 stars (well adopted)");
}

TEST(DockerHubAdoption, missing_counts)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(_, _)).WillOnce(respond(200, R"({"name": "tool"})"));

  DockerHubAdoption strategy(http);
  auto result = assess(strategy, "someuser/tool");
  EXPECT_EQ(result.points(), 0);
  EXPECT_EQ(result.detail(), "Docker Hub: 0 pulls, 0 stars (low adoption)");
}

TEST(DockerHubAdoption, unavailable)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(_, _)).WillOnce(fail(trustgate::http::HttpClientErrc::NameResolutionFailed));

  DockerHubAdoption strategy(http);
  auto result = assess(strategy, "someuser/tool");
  EXPECT_EQ(result.points(), 0);
  EXPECT_EQ(result.detail(), "Docker Hub API unavailable for someuser/tool");
}

TEST(DockerHubAdoption, not_found)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(_, _)).WillOnce(respond(404, R"({"message": "object not found"})"));

  DockerHubAdoption strategy(http);
  auto result = assess(strategy, "someuser/tool");
  EXPECT_EQ(result.points(), 0);
  EXPECT_EQ(result.detail(), "Docker Hub API unavailable for someuser/tool");
}

TEST(DockerHubAdoption, score_tiers)
{
  EXPECT_EQ(DockerHubAdoption::score(1'000'000, 0).points(), 15);
  EXPECT_EQ(DockerHubAdoption::score(999'999, 0).points(), 10);
  EXPECT_EQ(DockerHubAdoption::score(100'000, 0).points(), 10);
  EXPECT_EQ(DockerHubAdoption::score(99'999, 0).points(), 5);
  EXPECT_EQ(DockerHubAdoption::score(10'000, 0).points(), 5);
  EXPECT_EQ(DockerHubAdoption::score(9'999, 0).points(), 0);
  EXPECT_EQ(DockerHubAdoption::score(10'000, 0).detail(), "Docker Hub: 10000 pulls, 0 stars (moderately adopted)");
}

TEST(QuayAdoption, well_adopted)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(Eq("https://quay.io/api/v1/repository/prometheus/node-exporter"), _))
    .WillOnce(respond(200, R"({"star_count": 12, "tags": {"v1": {}, "v2": {}}})"));

  QuayAdoption strategy(http);
  auto result = assess(strategy, "quay.io/prometheus/node-exporter:v1.7.0");
  EXPECT_EQ(result.points(), 15);
  EXPECT_EQ(result.detail(), "Quay.io: 12 stars, 2 tags (well adopted)");
}

TEST(QuayAdoption, tags_only)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(_, _)).WillOnce(respond(200, R"({"star_count": 0, "tags": {"a": {}, "b": {}, "c": {}, "d": {}, "e": {}}})"));

  QuayAdoption strategy(http);
  auto result = assess(strategy, "quay.io/org/app");
  EXPECT_EQ(result.points(), 10);
  EXPECT_EQ(result.detail(), "Quay.io: 0 stars, 5 tags (moderately adopted)");
}

TEST(QuayAdoption, limited_data)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(_, _)).WillOnce(respond(200, R"({"star_count": 1})"));

  QuayAdoption strategy(http);
  auto result = assess(strategy, "quay.io/org/app");
  EXPECT_EQ(result.points(), 5);
  EXPECT_EQ(result.detail(), "Quay.io: 1 stars, 0 tags (limited adoption data)");
}

TEST(QuayAdoption, unavailable)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(_, _)).WillOnce(fail(trustgate::http::HttpClientErrc::Timeout));

  QuayAdoption strategy(http);
  auto result = assess(strategy, "quay.io/org/app");
  EXPECT_EQ(result.points(), 5);
  EXPECT_EQ(result.detail(), "Quay.io API unavailable — partial score awarded");
}

TEST(QuayAdoption, invalid_json)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(_, _)).WillOnce(respond(200, "<html>maintenance</html>"));

  QuayAdoption strategy(http);
  auto result = assess(strategy, "quay.io/org/app");
  EXPECT_EQ(result.points(), 5);
  EXPECT_EQ(result.detail(), "Quay.io API unavailable — partial score awarded");
}

TEST(GhcrAdoption, actively_maintained)
{
  std::string versions = "[";
  for (int i = 0; i < 60; i++)
    {
      versions += (i == 0 ? "" : ",");
      versions += R"({"id": )" + std::to_string(i) + "}";
    }
  versions += "]";

  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http,
              get(Eq("https://api.github.com/orgs/org/packages/container/app/versions?per_page=100"),
                  Eq(Headers{{"Accept", "application/vnd.github+json"}})))
    .WillOnce(respond(200, versions));

  GhcrAdoption strategy(http, "");
  auto result = assess(strategy, "ghcr.io/org/app:1.0");
  EXPECT_EQ(result.points(), 15);
  EXPECT_EQ(result.detail(), "GHCR: 60 versions (actively maintained)");
}

TEST(GhcrAdoption, token_and_nested_package)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http,
              get(Eq("https://api.github.com/orgs/org/packages/container/team%2Ftool/versions?per_page=100"),
                  Eq(Headers{{"Accept", "application/vnd.github+json"}, {"Authorization", "Bearer secret"}})))
    .WillOnce(respond(200, R"([{"id": 1}, {"id": 2}, {"id": 3}, {"id": 4}, {"id": 5}, {"id": 6}, {"id": 7}, {"id": 8}, {"id": 9}, {"id": 10}])"));

  GhcrAdoption strategy(http, "secret");
  auto result = assess(strategy, "ghcr.io/org/team/tool:v2");
  EXPECT_EQ(result.points(), 10);
  EXPECT_EQ(result.detail(), "GHCR: 10 versions");
}

TEST(GhcrAdoption, unavailable)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(_, _)).WillOnce(respond(401, R"({"message": "Requires authentication"})"));

  GhcrAdoption strategy(http, "");
  auto result = assess(strategy, "ghcr.io/org/app");
  EXPECT_EQ(result.points(), 5);
  EXPECT_EQ(result.detail(), "GHCR: 0 versions (limited history)");
}

TEST(CuratedAdoption, full_score)
{
  CuratedAdoption strategy;
  auto result = assess(strategy, "registry.redhat.io/rhel9/postgresql-15");
  EXPECT_EQ(result.points(), 15);
  EXPECT_EQ(result.detail(), "registry.redhat.io is a curated registry — adoption verified");
}

TEST(AdoptionEvaluator, dispatch_by_registry)
{
  auto http = std::make_shared<HttpClientMock>();
  EXPECT_CALL(*http, get(_, _)).Times(0);

  AdoptionEvaluator evaluator(std::make_shared<UnrecognizedAdoption>());
  evaluator.register_strategy("quay.io", std::make_shared<QuayAdoption>(http));
  evaluator.register_strategy("registry.example.com", std::make_shared<CuratedAdoption>());

  auto image = trustgate::parse_image_reference("registry.example.com/team/app");
  auto unknown = trustgate::parse_image_reference("artifactory.corp.net/team/app");

  std::optional<trustgate::EvaluatorResult> curated_result;
  std::optional<trustgate::EvaluatorResult> unknown_result;
  boost::asio::io_context ioc;
  boost::asio::co_spawn(
    ioc,
    [&]() -> boost::asio::awaitable<void> {
      curated_result.emplace(co_await evaluator.evaluate(image));
      unknown_result.emplace(co_await evaluator.evaluate(unknown));
    },
    boost::asio::detached);
  ioc.run();

  ASSERT_TRUE(curated_result.has_value());
  EXPECT_EQ(curated_result->points(), 15);

  ASSERT_TRUE(unknown_result.has_value());
  EXPECT_EQ(unknown_result->points(), 0);
  EXPECT_EQ(unknown_result->detail(), "Unknown registry type — cannot assess adoption");
}
