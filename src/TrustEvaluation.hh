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

#ifndef TRUST_EVALUATION_HH
#define TRUST_EVALUATION_HH

#include <exception>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include "trustgate/Capabilities.hh"
#include "trustgate/TrustGate.hh"
#include "http/HttpClient.hh"
#include "utils/Logging.hh"
#include "utils/TimeSource.hh"

#include "AdoptionEvaluator.hh"
#include "RecencyEvaluator.hh"
#include "ScoreAggregator.hh"
#include "SignatureEvaluator.hh"
#include "VendorTrustEvaluator.hh"
#include "VulnerabilityEvaluator.hh"

class TrustEvaluation : public trustgate::TrustGate
{
public:
  TrustEvaluation(boost::asio::io_context &ioc, trustgate::EvaluationConfig config);

  TrustEvaluation(trustgate::EvaluationConfig config,
                  std::shared_ptr<trustgate::ImageInspector> inspector,
                  std::shared_ptr<trustgate::VulnerabilityScanner> scanner,
                  std::shared_ptr<trustgate::SignatureVerifier> verifier,
                  std::shared_ptr<trustgate::http::IHttpClient> http,
                  std::shared_ptr<trustgate::utils::TimeSource> time_source);

  boost::asio::awaitable<outcome::std_result<trustgate::EvaluationReport>> evaluate(std::string reference) override;

private:
  using report_slot_t = std::optional<outcome::std_result<trustgate::EvaluationReport>>;

  boost::asio::awaitable<void> run_evaluators(trustgate::ImageReference image, report_slot_t &report);
  void log_exception(std::exception_ptr ex, const char *what);

private:
  trustgate::EvaluationConfig config;
  std::shared_ptr<trustgate::utils::TimeSource> time_source;
  VendorTrustEvaluator vendor_evaluator;
  RecencyEvaluator recency_evaluator;
  AdoptionEvaluator adoption_evaluator;
  VulnerabilityEvaluator vulnerability_evaluator;
  SignatureEvaluator signature_evaluator;
  ScoreAggregator aggregator;
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:evaluation")};
};

#endif // TRUST_EVALUATION_HH
