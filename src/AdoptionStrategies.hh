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

#ifndef ADOPTION_STRATEGIES_HH
#define ADOPTION_STRATEGIES_HH

#include <memory>
#include <optional>
#include <string>

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "http/HttpClient.hh"
#include "utils/Logging.hh"

#include "AdoptionStrategy.hh"

// Scores Docker Hub repositories by pull count.
class DockerHubAdoption : public AdoptionStrategy
{
public:
  explicit DockerHubAdoption(std::shared_ptr<trustgate::http::IHttpClient> http);

  boost::asio::awaitable<trustgate::EvaluatorResult> assess(const trustgate::ImageReference &image) override;

  static trustgate::EvaluatorResult score(std::int64_t pull_count, std::int64_t star_count);

private:
  std::shared_ptr<trustgate::http::IHttpClient> http;
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:adoption:dockerhub")};
};

// Scores Quay repositories by stars and tags.
class QuayAdoption : public AdoptionStrategy
{
public:
  explicit QuayAdoption(std::shared_ptr<trustgate::http::IHttpClient> http);

  boost::asio::awaitable<trustgate::EvaluatorResult> assess(const trustgate::ImageReference &image) override;

  static trustgate::EvaluatorResult score(std::int64_t star_count, std::int64_t tag_count);

private:
  std::shared_ptr<trustgate::http::IHttpClient> http;
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:adoption:quay")};
};

// Scores GitHub Container Registry packages by published version count.
class GhcrAdoption : public AdoptionStrategy
{
public:
  GhcrAdoption(std::shared_ptr<trustgate::http::IHttpClient> http, std::string token);

  boost::asio::awaitable<trustgate::EvaluatorResult> assess(const trustgate::ImageReference &image) override;

  static trustgate::EvaluatorResult score(std::int64_t version_count);

private:
  std::shared_ptr<trustgate::http::IHttpClient> http;
  std::string token;
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:adoption:ghcr")};
};

class CuratedAdoption : public AdoptionStrategy
{
public:
  boost::asio::awaitable<trustgate::EvaluatorResult> assess(const trustgate::ImageReference &image) override;
};

class UnrecognizedAdoption : public AdoptionStrategy
{
public:
  boost::asio::awaitable<trustgate::EvaluatorResult> assess(const trustgate::ImageReference &image) override;
};

#endif // ADOPTION_STRATEGIES_HH
