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

#include "ScoreAggregator.hh"

#include <algorithm>
#include <numeric>
#include <utility>

#include "trustgate/TrustGateErrors.hh"

using trustgate::Criterion;
using trustgate::Decision;

ScoreAggregator::ScoreAggregator(trustgate::DecisionThresholds thresholds)
  : thresholds(thresholds)
{
}

outcome::std_result<trustgate::EvaluationReport>
ScoreAggregator::build(trustgate::ImageReference image,
                       std::chrono::system_clock::time_point timestamp,
                       std::vector<trustgate::EvaluatorResult> results,
                       bool vendor_known,
                       trustgate::VulnerabilityCounts vulnerabilities,
                       trustgate::ImageMetadata metadata) const
{
  std::sort(results.begin(), results.end(), [](const auto &a, const auto &b) { return a.criterion() < b.criterion(); });

  auto criteria = trustgate::utils::enum_range<Criterion>();
  if (results.size() != static_cast<std::size_t>(trustgate::utils::enum_count<Criterion>())
      || !std::equal(results.begin(), results.end(), criteria.begin(), [](const auto &r, Criterion c) { return r.criterion() == c; }))
    {
      logger->error("incomplete set of evaluator results ({} results)", results.size());
      return trustgate::TrustGateErrc::InternalError;
    }

  trustgate::EvaluationReport report;
  report.image = std::move(image);
  report.timestamp = timestamp;
  report.total_score = std::accumulate(results.begin(), results.end(), 0, [](int sum, const auto &r) { return sum + r.points(); });
  report.results = std::move(results);
  report.vendor_known = vendor_known;
  report.decision = decide(report.total_score, vendor_known, thresholds);
  report.vulnerabilities = vulnerabilities;
  report.metadata = std::move(metadata);

  logger->info("{} scored {}/{} ({})", report.image.reference, report.total_score, report.max_score, report.decision);
  return report;
}

Decision
ScoreAggregator::decide(int total, bool vendor_known, const trustgate::DecisionThresholds &thresholds)
{
  if (total >= thresholds.auto_approve)
    {
      return vendor_known ? Decision::AutoApprove : Decision::NeedsHumanReview;
    }
  if (total >= thresholds.human_review)
    {
      return Decision::NeedsHumanReview;
    }
  return Decision::AutoReject;
}
