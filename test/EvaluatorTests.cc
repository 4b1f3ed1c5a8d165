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

#include "trustgate/EvaluationConfig.hh"
#include "trustgate/ImageReference.hh"
#include "trustgate/Report.hh"

#include "ImageInspectorMock.hh"
#include "RecencyEvaluator.hh"
#include "SignatureEvaluator.hh"
#include "SignatureVerifierMock.hh"
#include "TestBase.hh"
#include "TimeSourceMock.hh"
#include "ToolErrors.hh"
#include "VendorTrustEvaluator.hh"
#include "VulnerabilityEvaluator.hh"
#include "VulnerabilityScannerMock.hh"

using ::testing::_;
using ::testing::InvokeWithoutArgs;
using ::testing::Return;

using trustgate::Criterion;
using trustgate::ImageInspection;
using trustgate::SignatureStatus;
using trustgate::VulnerabilityCounts;

namespace
{
  constexpr const char *now = "2024-06-01T12:00:00Z";

  std::shared_ptr<TimeSourceMock> make_time_source()
  {
    auto time_source = std::make_shared<TimeSourceMock>();
    EXPECT_CALL(*time_source, now()).WillRepeatedly(Return(test_time(now)));
    return time_source;
  }

  RecencyAssessment evaluate_recency(std::shared_ptr<ImageInspectorMock> inspector, const std::string &reference)
  {
    RecencyEvaluator evaluator(inspector, make_time_source(), std::chrono::days(90), std::chrono::days(365));
    auto image = trustgate::parse_image_reference(reference);

    std::optional<RecencyAssessment> assessment;
    boost::asio::io_context ioc;
    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> {
        try
          {
            assessment.emplace(co_await evaluator.evaluate(image));
          }
        catch (std::exception &e)
          {
            spdlog::info("Exception {}", e.what());
            EXPECT_TRUE(false);
          }
      },
      boost::asio::detached);
    ioc.run();

    EXPECT_TRUE(assessment.has_value());
    return assessment.value_or(RecencyAssessment{trustgate::EvaluatorResult(Criterion::Recency, 0, ""), {}});
  }

  RecencyAssessment evaluate_recency(outcome::std_result<ImageInspection> inspection)
  {
    auto inspector = std::make_shared<ImageInspectorMock>();
    EXPECT_CALL(*inspector, inspect(_)).WillOnce(InvokeWithoutArgs([inspection]() {
      return awaitable_value<outcome::std_result<ImageInspection>>(inspection);
    }));
    return evaluate_recency(inspector, "quay.io/org/app:1.0");
  }

  RecencyAssessment evaluate_created(const std::string &created)
  {
    ImageInspection inspection;
    inspection.created = test_time(created);
    return evaluate_recency(inspection);
  }

  VulnerabilityAssessment evaluate_vulnerabilities(outcome::std_result<VulnerabilityCounts> counts)
  {
    auto scanner = std::make_shared<VulnerabilityScannerMock>();
    EXPECT_CALL(*scanner, scan(_)).WillOnce(InvokeWithoutArgs([counts]() {
      return awaitable_value<outcome::std_result<VulnerabilityCounts>>(counts);
    }));

    VulnerabilityEvaluator evaluator(scanner);
    auto image = trustgate::parse_image_reference("nginx:1.25");

    std::optional<VulnerabilityAssessment> assessment;
    boost::asio::io_context ioc;
    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> { assessment.emplace(co_await evaluator.evaluate(image)); },
      boost::asio::detached);
    ioc.run();

    EXPECT_TRUE(assessment.has_value());
    return assessment.value_or(VulnerabilityEvaluator::score({}));
  }
} // namespace

TEST(VendorTrust, trusted_registry)
{
  auto config = trustgate::EvaluationConfig::defaults();
  VendorTrustEvaluator evaluator(config.trusted_registries, config.trusted_namespaces);

  auto assessment = evaluator.evaluate(trustgate::parse_image_reference("registry.access.redhat.com/ubi9/ubi:latest"));
  EXPECT_EQ(assessment.result.criterion(), Criterion::Vendor);
  EXPECT_EQ(assessment.result.points(), 30);
  EXPECT_EQ(assessment.result.detail(), "Registry registry.access.redhat.com is a trusted vendor registry");
  EXPECT_TRUE(assessment.vendor_known);
}

TEST(VendorTrust, trusted_namespace)
{
  auto config = trustgate::EvaluationConfig::defaults();
  VendorTrustEvaluator evaluator(config.trusted_registries, config.trusted_namespaces);

  auto assessment = evaluator.evaluate(trustgate::parse_image_reference("docker.io/bitnami/redis:7"));
  EXPECT_EQ(assessment.result.points(), 30);
  EXPECT_EQ(assessment.result.detail(), "bitnami is a known trusted vendor");
  EXPECT_TRUE(assessment.vendor_known);
}

TEST(VendorTrust, unknown_vendor)
{
  auto config = trustgate::EvaluationConfig::defaults();
  VendorTrustEvaluator evaluator(config.trusted_registries, config.trusted_namespaces);

  auto assessment = evaluator.evaluate(trustgate::parse_image_reference("someuser/someimage:latest"));
  EXPECT_EQ(assessment.result.points(), 0);
  EXPECT_EQ(assessment.result.detail(), "someuser is NOT a known trusted vendor (unknown vendors require human review)");
  EXPECT_FALSE(assessment.vendor_known);
}

TEST(VendorTrust, registry_match_is_exact)
{
  VendorTrustEvaluator evaluator({"registry.example.com"}, {});

  EXPECT_TRUE(evaluator.evaluate(trustgate::parse_image_reference("registry.example.com/team/app")).vendor_known);
  EXPECT_FALSE(evaluator.evaluate(trustgate::parse_image_reference("mirror.registry.example.com/team/app")).vendor_known);
}

TEST(VendorTrust, namespace_match_is_case_sensitive)
{
  VendorTrustEvaluator evaluator({}, {"bitnami"});

  EXPECT_TRUE(evaluator.evaluate(trustgate::parse_image_reference("bitnami/redis")).vendor_known);
  EXPECT_FALSE(evaluator.evaluate(trustgate::parse_image_reference("Bitnami/redis")).vendor_known);
}

TEST(Recency, recent_image)
{
  auto assessment = evaluate_created("2024-05-22T12:00:00Z");
  EXPECT_EQ(assessment.result.criterion(), Criterion::Recency);
  EXPECT_EQ(assessment.result.points(), 15);
  EXPECT_EQ(assessment.result.detail(), "Last published 10 days ago (within 90d threshold)");
}

TEST(Recency, threshold_boundary)
{
  auto at_threshold = evaluate_created("2024-03-03T12:00:00Z");
  EXPECT_EQ(at_threshold.result.points(), 15);
  EXPECT_EQ(at_threshold.result.detail(), "Last published 90 days ago (within 90d threshold)");

  auto past_threshold = evaluate_created("2024-03-02T12:00:00Z");
  EXPECT_EQ(past_threshold.result.points(), 5);
  EXPECT_EQ(past_threshold.result.detail(), "Last published 91 days ago (older than 90d but within 1 year)");
}

TEST(Recency, stale_image)
{
  auto within_year = evaluate_created("2023-06-02T12:00:00Z");
  EXPECT_EQ(within_year.result.points(), 5);

  auto stale = evaluate_created("2023-01-01T00:00:00Z");
  EXPECT_EQ(stale.result.points(), 0);
  EXPECT_EQ(stale.result.detail(), "Last published 517 days ago (STALE: over 1 year old)");
}

TEST(Recency, future_creation_date)
{
  auto assessment = evaluate_created("2024-07-01T00:00:00Z");
  EXPECT_EQ(assessment.result.points(), 15);
  EXPECT_EQ(assessment.result.detail(), "Last published 0 days ago (within 90d threshold)");
}

TEST(Recency, metadata)
{
  ImageInspection inspection;
  inspection.created = test_time("2024-05-31T12:00:00Z");
  inspection.digest = "sha256:1234";
  inspection.layer_count = 3;
  inspection.size_bytes = 3 * 1024 * 1024;

  auto assessment = evaluate_recency(inspection);
  EXPECT_EQ(assessment.result.points(), 15);
  ASSERT_TRUE(assessment.metadata.created.has_value());
  EXPECT_EQ(*assessment.metadata.created, test_time("2024-05-31T12:00:00Z"));
  EXPECT_EQ(assessment.metadata.digest, "sha256:1234");
  EXPECT_EQ(assessment.metadata.layers, 3);
  ASSERT_TRUE(assessment.metadata.size_mb.has_value());
  EXPECT_DOUBLE_EQ(*assessment.metadata.size_mb, 3.0);
}

TEST(Recency, missing_creation_date)
{
  ImageInspection inspection;
  inspection.digest = "sha256:1234";

  auto assessment = evaluate_recency(inspection);
  EXPECT_EQ(assessment.result.points(), 0);
  EXPECT_EQ(assessment.result.detail(), "Could not determine image creation date");
  EXPECT_EQ(assessment.metadata.digest, "sha256:1234");
}

TEST(Recency, skopeo_not_available)
{
  auto assessment = evaluate_recency(outcome::std_result<ImageInspection>(ToolErrc::NotFound));
  EXPECT_EQ(assessment.result.points(), 0);
  EXPECT_EQ(assessment.result.detail(), "skopeo not available — skipping recency check");
  EXPECT_FALSE(assessment.metadata.created.has_value());
  EXPECT_FALSE(assessment.metadata.digest.has_value());
}

TEST(Recency, skopeo_failed)
{
  auto assessment = evaluate_recency(outcome::std_result<ImageInspection>(ToolErrc::Failed));
  EXPECT_EQ(assessment.result.points(), 0);
  EXPECT_EQ(assessment.result.detail(), "skopeo inspect failed — image may not be publicly accessible");
}

TEST(Recency, skopeo_timeout)
{
  auto assessment = evaluate_recency(outcome::std_result<ImageInspection>(ToolErrc::Timeout));
  EXPECT_EQ(assessment.result.points(), 0);
  EXPECT_EQ(assessment.result.detail(), "skopeo inspect timed out — skipping recency check");
}

TEST(Recency, score_age_with_custom_thresholds)
{
  RecencyEvaluator evaluator(std::make_shared<ImageInspectorMock>(), make_time_source(), std::chrono::days(30), std::chrono::days(60));

  EXPECT_EQ(evaluator.score_age(30).points(), 15);
  EXPECT_EQ(evaluator.score_age(31).points(), 5);
  EXPECT_EQ(evaluator.score_age(60).points(), 5);
  EXPECT_EQ(evaluator.score_age(61).points(), 0);
}

TEST(Vulnerability, clean_image)
{
  auto assessment = evaluate_vulnerabilities(VulnerabilityCounts{0, 0, 4, 7});
  EXPECT_EQ(assessment.critical.criterion(), Criterion::VulnerabilityCritical);
  EXPECT_EQ(assessment.critical.points(), 20);
  EXPECT_EQ(assessment.critical.detail(), "0 CRITICAL CVEs found");
  EXPECT_EQ(assessment.high.criterion(), Criterion::VulnerabilityHigh);
  EXPECT_EQ(assessment.high.points(), 10);
  EXPECT_EQ(assessment.high.detail(), "0 HIGH CVEs found");
  EXPECT_EQ(assessment.counts, (VulnerabilityCounts{0, 0, 4, 7}));
}

TEST(Vulnerability, single_critical_is_same_as_many)
{
  auto one = evaluate_vulnerabilities(VulnerabilityCounts{1, 0, 0, 0});
  auto many = evaluate_vulnerabilities(VulnerabilityCounts{1000, 0, 0, 0});

  EXPECT_EQ(one.critical.points(), 0);
  EXPECT_EQ(many.critical.points(), 0);
  EXPECT_EQ(one.critical.detail(), "1 CRITICAL CVEs found");
  EXPECT_EQ(many.critical.detail(), "1000 CRITICAL CVEs found");
  EXPECT_EQ(one.high.points(), 10);
}

TEST(Vulnerability, high_findings)
{
  auto assessment = evaluate_vulnerabilities(VulnerabilityCounts{0, 3, 0, 0});
  EXPECT_EQ(assessment.critical.points(), 20);
  EXPECT_EQ(assessment.high.points(), 0);
  EXPECT_EQ(assessment.high.detail(), "3 HIGH CVEs found");
}

TEST(Vulnerability, trivy_not_available)
{
  auto assessment = evaluate_vulnerabilities(outcome::std_result<VulnerabilityCounts>(ToolErrc::NotFound));
  EXPECT_EQ(assessment.critical.points(), 10);
  EXPECT_EQ(assessment.critical.detail(), "Trivy not available — partial score awarded");
  EXPECT_EQ(assessment.high.points(), 10);
  EXPECT_EQ(assessment.high.detail(), "0 HIGH CVEs found (scan unavailable)");
  EXPECT_EQ(assessment.counts, VulnerabilityCounts{});
}

TEST(Vulnerability, trivy_no_results)
{
  auto assessment = evaluate_vulnerabilities(outcome::std_result<VulnerabilityCounts>(ToolErrc::InvalidOutput));
  EXPECT_EQ(assessment.critical.points(), 10);
  EXPECT_EQ(assessment.critical.detail(), "Trivy scan returned no results — partial score");
  EXPECT_EQ(assessment.high.points(), 10);
}

TEST(Vulnerability, trivy_timeout)
{
  auto assessment = evaluate_vulnerabilities(outcome::std_result<VulnerabilityCounts>(ToolErrc::Timeout));
  EXPECT_EQ(assessment.critical.points(), 10);
  EXPECT_EQ(assessment.critical.detail(), "Trivy scan timed out — partial score");
}

TEST(Signature, score)
{
  auto verified = SignatureEvaluator::score(SignatureStatus::Verified);
  EXPECT_EQ(verified.criterion(), Criterion::Signature);
  EXPECT_EQ(verified.points(), 10);
  EXPECT_EQ(verified.detail(), "cosign signature verified (Sigstore)");

  auto not_verified = SignatureEvaluator::score(SignatureStatus::NotVerified);
  EXPECT_EQ(not_verified.points(), 0);
  EXPECT_EQ(not_verified.detail(), "No cosign signature found (not signed or verification failed)");

  auto unavailable = SignatureEvaluator::score(SignatureStatus::Unavailable);
  EXPECT_EQ(unavailable.points(), 0);
  EXPECT_EQ(unavailable.detail(), "cosign not available — skipping signature check");
}

TEST(Signature, evaluate)
{
  auto verifier = std::make_shared<SignatureVerifierMock>();
  EXPECT_CALL(*verifier, verify(_)).WillOnce(InvokeWithoutArgs([]() { return awaitable_value(SignatureStatus::Verified); }));

  SignatureEvaluator evaluator(verifier);
  auto image = trustgate::parse_image_reference("ghcr.io/org/app:1");

  std::optional<trustgate::EvaluatorResult> result;
  boost::asio::io_context ioc;
  boost::asio::co_spawn(
    ioc,
    [&]() -> boost::asio::awaitable<void> { result.emplace(co_await evaluator.evaluate(image)); },
    boost::asio::detached);
  ioc.run();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->points(), 10);
}

TEST(EvaluatorResult, points_are_clamped)
{
  EXPECT_EQ(trustgate::EvaluatorResult(Criterion::Recency, 40, "").points(), 15);
  EXPECT_EQ(trustgate::EvaluatorResult(Criterion::Recency, -5, "").points(), 0);
  EXPECT_EQ(trustgate::EvaluatorResult(Criterion::Vendor, 30, "").max_points(), 30);
}
