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

#ifndef SCORE_AGGREGATOR_HH
#define SCORE_AGGREGATOR_HH

#include <chrono>
#include <memory>
#include <vector>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "trustgate/EvaluationConfig.hh"
#include "trustgate/Report.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

class ScoreAggregator
{
public:
  explicit ScoreAggregator(trustgate::DecisionThresholds thresholds);

  // Requires exactly one result per criterion.
  outcome::std_result<trustgate::EvaluationReport> build(trustgate::ImageReference image,
                                                         std::chrono::system_clock::time_point timestamp,
                                                         std::vector<trustgate::EvaluatorResult> results,
                                                         bool vendor_known,
                                                         trustgate::VulnerabilityCounts vulnerabilities,
                                                         trustgate::ImageMetadata metadata) const;

  // Unknown vendors are never auto-approved, whatever their score.
  static trustgate::Decision decide(int total, bool vendor_known, const trustgate::DecisionThresholds &thresholds);

private:
  trustgate::DecisionThresholds thresholds;
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:aggregator")};
};

#endif // SCORE_AGGREGATOR_HH
