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

#include "AdoptionStrategies.hh"

#include <utility>

#include <boost/algorithm/string/replace.hpp>
#include <fmt/format.h>

#include "JsonUtils.hh"

using trustgate::Criterion;
using trustgate::EvaluatorResult;

namespace
{
  std::optional<boost::json::value> parse_response(const outcome::std_result<trustgate::http::Response> &rc,
                                                   const std::string &url,
                                                   spdlog::logger &logger)
  {
    if (!rc)
      {
        logger.info("request to {} failed ({})", url, rc.error());
        return {};
      }

    auto &[status, body] = rc.value();
    if (status != 200)
      {
        logger.info("request to {} returned HTTP {}", url, status);
        return {};
      }

    boost::system::error_code ec;
    auto doc = boost::json::parse(body, ec);
    if (ec)
      {
        logger.info("invalid JSON from {} ({})", url, ec.message());
        return {};
      }
    return doc;
  }
} // namespace

DockerHubAdoption::DockerHubAdoption(std::shared_ptr<trustgate::http::IHttpClient> http)
  : http(std::move(http))
{
}

boost::asio::awaitable<EvaluatorResult>
DockerHubAdoption::assess(const trustgate::ImageReference &image)
{
  // Official images such as `nginx` live in the `library` namespace.
  std::string ns = image.namespace_name;
  if (image.single_segment)
    {
      ns = "library";
    }

  auto url = fmt::format("https://hub.docker.com/v2/repositories/{}/{}/", ns, image.repository);
  auto rc = co_await http->get(url, {});

  auto doc = parse_response(rc, url, *logger);
  if (!doc || !doc->is_object())
    {
      co_return EvaluatorResult(Criterion::Adoption,
                                0,
                                fmt::format("Docker Hub API unavailable for {}/{}", image.namespace_name, image.repository));
    }

  JsonUtils json_utils;
  auto pull_count = json_utils.extract_integer(*doc, "pull_count").value_or(0);
  auto star_count = json_utils.extract_integer(*doc, "star_count").value_or(0);
  co_return score(pull_count, star_count);
}

EvaluatorResult
DockerHubAdoption::score(std::int64_t pull_count, std::int64_t star_count)
{
  int points = 0;
  const char *label = "low adoption";

  if (pull_count >= 1'000'000)
    {
      points = 15;
      label = "highly adopted";
    }
  else if (pull_count >= 100'000)
    {
      points = 10;
      label = "well adopted";
    }
  else if (pull_count >= 10'000)
    {
      points = 5;
      label = "moderately adopted";
    }

  return EvaluatorResult(Criterion::Adoption, points, fmt::format("Docker Hub: {} pulls, {} stars ({})", pull_count, star_count, label));
}

QuayAdoption::QuayAdoption(std::shared_ptr<trustgate::http::IHttpClient> http)
  : http(std::move(http))
{
}

boost::asio::awaitable<EvaluatorResult>
QuayAdoption::assess(const trustgate::ImageReference &image)
{
  auto url = fmt::format("https://quay.io/api/v1/repository/{}/{}", image.namespace_name, image.repository);
  auto rc = co_await http->get(url, {});

  auto doc = parse_response(rc, url, *logger);
  if (!doc || !doc->is_object())
    {
      co_return EvaluatorResult(Criterion::Adoption, 5, "Quay.io API unavailable — partial score awarded");
    }

  JsonUtils json_utils;
  auto star_count = json_utils.extract_integer(*doc, "star_count").value_or(0);
  auto tag_count = static_cast<std::int64_t>(json_utils.extract_length(*doc, "tags"));
  co_return score(star_count, tag_count);
}

EvaluatorResult
QuayAdoption::score(std::int64_t star_count, std::int64_t tag_count)
{
  int points = 5;
  const char *label = "limited adoption data";

  if (star_count >= 10 || tag_count >= 20)
    {
      points = 15;
      label = "well adopted";
    }
  else if (star_count >= 3 || tag_count >= 5)
    {
      points = 10;
      label = "moderately adopted";
    }

  return EvaluatorResult(Criterion::Adoption, points, fmt::format("Quay.io: {} stars, {} tags ({})", star_count, tag_count, label));
}

GhcrAdoption::GhcrAdoption(std::shared_ptr<trustgate::http::IHttpClient> http, std::string token)
  : http(std::move(http))
  , token(std::move(token))
{
}

boost::asio::awaitable<EvaluatorResult>
GhcrAdoption::assess(const trustgate::ImageReference &image)
{
  auto package = boost::algorithm::replace_all_copy(image.repository, "/", "%2F");
  auto url = fmt::format("https://api.github.com/orgs/{}/packages/container/{}/versions?per_page=100", image.namespace_name, package);

  trustgate::http::Headers headers{{"Accept", "application/vnd.github+json"}};
  if (!token.empty())
    {
      headers.emplace_back("Authorization", "Bearer " + token);
    }

  auto rc = co_await http->get(url, headers);

  std::int64_t version_count = 0;
  auto doc = parse_response(rc, url, *logger);
  if (doc && doc->is_array())
    {
      version_count = static_cast<std::int64_t>(doc->as_array().size());
    }
  co_return score(version_count);
}

EvaluatorResult
GhcrAdoption::score(std::int64_t version_count)
{
  if (version_count >= 50)
    {
      return EvaluatorResult(Criterion::Adoption, 15, fmt::format("GHCR: {} versions (actively maintained)", version_count));
    }
  if (version_count >= 10)
    {
      return EvaluatorResult(Criterion::Adoption, 10, fmt::format("GHCR: {} versions", version_count));
    }
  return EvaluatorResult(Criterion::Adoption, 5, fmt::format("GHCR: {} versions (limited history)", version_count));
}

boost::asio::awaitable<EvaluatorResult>
CuratedAdoption::assess(const trustgate::ImageReference &image)
{
  co_return EvaluatorResult(Criterion::Adoption, 15, fmt::format("{} is a curated registry — adoption verified", image.registry));
}

boost::asio::awaitable<EvaluatorResult>
UnrecognizedAdoption::assess(const trustgate::ImageReference &image)
{
  co_return EvaluatorResult(Criterion::Adoption, 0, "Unknown registry type — cannot assess adoption");
}
