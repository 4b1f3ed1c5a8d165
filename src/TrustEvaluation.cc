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

#include "TrustEvaluation.hh"

#include <utility>
#include <vector>

#include <boost/asio/experimental/parallel_group.hpp>

#include "trustgate/TrustGateErrors.hh"
#include "http/HttpClient.hh"

#include "AdoptionStrategies.hh"
#include "CosignVerifier.hh"
#include "ProcessToolRunner.hh"
#include "SkopeoInspector.hh"
#include "TrivyScanner.hh"

using trustgate::EvaluationReport;
using trustgate::TrustGateErrc;

namespace
{
  template<typename T>
  boost::asio::awaitable<void> store(boost::asio::awaitable<T> op, std::optional<T> &slot)
  {
    slot.emplace(co_await std::move(op));
  }

  std::shared_ptr<trustgate::http::IHttpClient> make_http_client(const trustgate::EvaluationConfig &config)
  {
    auto http = std::make_shared<trustgate::http::HttpClient>();
    http->options().set_timeout(config.http_timeout);
    return http;
  }

  void register_adoption_strategies(AdoptionEvaluator &evaluator,
                                    const trustgate::EvaluationConfig &config,
                                    const std::shared_ptr<trustgate::http::IHttpClient> &http)
  {
    evaluator.register_strategy("docker.io", std::make_shared<DockerHubAdoption>(http));
    evaluator.register_strategy("quay.io", std::make_shared<QuayAdoption>(http));
    evaluator.register_strategy("ghcr.io", std::make_shared<GhcrAdoption>(http, config.github_token));

    auto curated = std::make_shared<CuratedAdoption>();
    for (const auto &registry: config.curated_registries)
      {
        evaluator.register_strategy(registry, curated);
      }
  }
} // namespace

std::shared_ptr<trustgate::TrustGate>
trustgate::TrustGate::create(boost::asio::io_context &ioc, EvaluationConfig config)
{
  return std::make_shared<TrustEvaluation>(ioc, std::move(config));
}

TrustEvaluation::TrustEvaluation(boost::asio::io_context &ioc, trustgate::EvaluationConfig config)
  : TrustEvaluation(config,
                    std::make_shared<SkopeoInspector>(std::make_shared<ProcessToolRunner>(ioc), config.skopeo_command, config.inspect_timeout),
                    std::make_shared<TrivyScanner>(std::make_shared<ProcessToolRunner>(ioc), config.trivy_command, config.scan_timeout),
                    std::make_shared<CosignVerifier>(std::make_shared<ProcessToolRunner>(ioc), config.cosign_command, config.signature_timeout),
                    make_http_client(config),
                    std::make_shared<trustgate::utils::RealTimeSource>())
{
}

TrustEvaluation::TrustEvaluation(trustgate::EvaluationConfig config,
                                 std::shared_ptr<trustgate::ImageInspector> inspector,
                                 std::shared_ptr<trustgate::VulnerabilityScanner> scanner,
                                 std::shared_ptr<trustgate::SignatureVerifier> verifier,
                                 std::shared_ptr<trustgate::http::IHttpClient> http,
                                 std::shared_ptr<trustgate::utils::TimeSource> time_source)
  : config(std::move(config))
  , time_source(time_source)
  , vendor_evaluator(this->config.trusted_registries, this->config.trusted_namespaces)
  , recency_evaluator(std::move(inspector), time_source, this->config.recency_threshold, this->config.stale_threshold)
  , adoption_evaluator(std::make_shared<UnrecognizedAdoption>())
  , vulnerability_evaluator(std::move(scanner))
  , signature_evaluator(std::move(verifier))
  , aggregator(this->config.thresholds)
{
  register_adoption_strategies(adoption_evaluator, this->config, http);
}

boost::asio::awaitable<outcome::std_result<EvaluationReport>>
TrustEvaluation::evaluate(std::string reference)
{
  auto image = trustgate::parse_image_reference(reference);
  if (image.reference.empty())
    {
      logger->error("empty image reference");
      co_return TrustGateErrc::InvalidArgument;
    }

  logger->info("evaluating {}", image.reference);
  logger->info("registry: {} namespace: {} repository: {} tag: {}", image.registry, image.namespace_name, image.repository, image.tag);

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer deadline(executor, config.evaluation_deadline);
  report_slot_t report;

  auto [order, ex, timer_ec] = co_await boost::asio::experimental::make_parallel_group(
                                 boost::asio::co_spawn(executor, run_evaluators(image, report), boost::asio::deferred),
                                 deadline.async_wait(boost::asio::deferred))
                                 .async_wait(boost::asio::experimental::wait_for_one(), boost::asio::use_awaitable);

  if ((co_await boost::asio::this_coro::cancellation_state).cancelled() != boost::asio::cancellation_type::none)
    {
      logger->warn("evaluation of {} cancelled", image.reference);
      co_return TrustGateErrc::EvaluationCancelled;
    }

  if (order[0] == 1)
    {
      logger->error("evaluation of {} exceeded the deadline of {}s", image.reference, config.evaluation_deadline.count());
      co_return TrustGateErrc::EvaluationCancelled;
    }

  if (ex)
    {
      log_exception(ex, "evaluation");
      co_return TrustGateErrc::InternalError;
    }

  if (!report)
    {
      co_return TrustGateErrc::InternalError;
    }
  co_return std::move(*report);
}

boost::asio::awaitable<void>
TrustEvaluation::run_evaluators(trustgate::ImageReference image, report_slot_t &report)
{
  auto executor = co_await boost::asio::this_coro::executor;

  auto vendor = vendor_evaluator.evaluate(image);

  std::optional<RecencyAssessment> recency;
  std::optional<trustgate::EvaluatorResult> adoption;
  std::optional<VulnerabilityAssessment> vulnerability;
  std::optional<trustgate::EvaluatorResult> signature;

  auto [order, recency_ex, adoption_ex, vulnerability_ex, signature_ex] =
    co_await boost::asio::experimental::make_parallel_group(
      boost::asio::co_spawn(executor, store(recency_evaluator.evaluate(image), recency), boost::asio::deferred),
      boost::asio::co_spawn(executor, store(adoption_evaluator.evaluate(image), adoption), boost::asio::deferred),
      boost::asio::co_spawn(executor, store(vulnerability_evaluator.evaluate(image), vulnerability), boost::asio::deferred),
      boost::asio::co_spawn(executor, store(signature_evaluator.evaluate(image), signature), boost::asio::deferred))
      .async_wait(boost::asio::experimental::wait_for_all(), boost::asio::use_awaitable);

  for (const auto &ex: {recency_ex, adoption_ex, vulnerability_ex, signature_ex})
    {
      if (ex)
        {
          log_exception(ex, "evaluator");
          report.emplace(TrustGateErrc::InternalError);
          co_return;
        }
    }

  if (!recency || !adoption || !vulnerability || !signature)
    {
      logger->error("evaluator finished without a result");
      report.emplace(TrustGateErrc::InternalError);
      co_return;
    }

  std::vector<trustgate::EvaluatorResult> results{vendor.result,
                                                  recency->result,
                                                  *adoption,
                                                  vulnerability->critical,
                                                  vulnerability->high,
                                                  *signature};

  report.emplace(aggregator.build(std::move(image),
                                  time_source->now(),
                                  std::move(results),
                                  vendor.vendor_known,
                                  vulnerability->counts,
                                  recency->metadata));
}

void
TrustEvaluation::log_exception(std::exception_ptr ex, const char *what)
{
  try
    {
      std::rethrow_exception(ex);
    }
  catch (const boost::system::system_error &e)
    {
      logger->error("{} aborted ({})", what, e.code().message());
    }
  catch (const std::exception &e)
    {
      logger->error("{} failed ({})", what, e.what());
    }
}
