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

#include "VulnerabilityEvaluator.hh"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "ToolErrors.hh"

using trustgate::Criterion;
using trustgate::EvaluatorResult;

VulnerabilityEvaluator::VulnerabilityEvaluator(std::shared_ptr<trustgate::VulnerabilityScanner> scanner)
  : scanner(std::move(scanner))
{
}

boost::asio::awaitable<VulnerabilityAssessment>
VulnerabilityEvaluator::evaluate(const trustgate::ImageReference &image)
{
  auto rc = co_await scanner->scan(image);
  if (rc)
    {
      co_return score(rc.value());
    }

  logger->info("vulnerability scan of {} failed ({})", image.reference, rc.error());

  std::string critical_detail = "Trivy scan returned no results — partial score";
  if (rc.error() == ToolErrc::NotFound)
    {
      critical_detail = "Trivy not available — partial score awarded";
    }
  else if (rc.error() == ToolErrc::Timeout)
    {
      critical_detail = "Trivy scan timed out — partial score";
    }

  // Without a scan there are no HIGH findings to hold against the image.
  co_return VulnerabilityAssessment{EvaluatorResult(Criterion::VulnerabilityCritical, 10, critical_detail),
                                    EvaluatorResult(Criterion::VulnerabilityHigh,
                                                    trustgate::max_points(Criterion::VulnerabilityHigh),
                                                    "0 HIGH CVEs found (scan unavailable)"),
                                    {}};
}

VulnerabilityAssessment
VulnerabilityEvaluator::score(const trustgate::VulnerabilityCounts &counts)
{
  auto critical_points = counts.critical == 0 ? trustgate::max_points(Criterion::VulnerabilityCritical) : 0;
  auto high_points = counts.high == 0 ? trustgate::max_points(Criterion::VulnerabilityHigh) : 0;

  return VulnerabilityAssessment{
    EvaluatorResult(Criterion::VulnerabilityCritical, critical_points, fmt::format("{} CRITICAL CVEs found", counts.critical)),
    EvaluatorResult(Criterion::VulnerabilityHigh, high_points, fmt::format("{} HIGH CVEs found", counts.high)),
    counts};
}
