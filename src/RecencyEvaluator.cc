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

#include "RecencyEvaluator.hh"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "utils/DateUtils.hh"

#include "ToolErrors.hh"

using trustgate::Criterion;
using trustgate::EvaluatorResult;

RecencyEvaluator::RecencyEvaluator(std::shared_ptr<trustgate::ImageInspector> inspector,
                                   std::shared_ptr<trustgate::utils::TimeSource> time_source,
                                   std::chrono::days recency_threshold,
                                   std::chrono::days stale_threshold)
  : inspector(std::move(inspector))
  , time_source(std::move(time_source))
  , recency_threshold(recency_threshold)
  , stale_threshold(stale_threshold)
{
}

boost::asio::awaitable<RecencyAssessment>
RecencyEvaluator::evaluate(const trustgate::ImageReference &image)
{
  auto rc = co_await inspector->inspect(image);
  if (!rc)
    {
      logger->info("inspection of {} failed ({})", image.reference, rc.error());
      if (rc.error() == ToolErrc::NotFound)
        {
          co_return RecencyAssessment{EvaluatorResult(Criterion::Recency, 0, "skopeo not available — skipping recency check"), {}};
        }
      if (rc.error() == ToolErrc::Timeout)
        {
          co_return RecencyAssessment{EvaluatorResult(Criterion::Recency, 0, "skopeo inspect timed out — skipping recency check"), {}};
        }
      co_return RecencyAssessment{
        EvaluatorResult(Criterion::Recency, 0, "skopeo inspect failed — image may not be publicly accessible"),
        {}};
    }

  auto metadata = to_metadata(rc.value());
  if (!metadata.created)
    {
      co_return RecencyAssessment{EvaluatorResult(Criterion::Recency, 0, "Could not determine image creation date"), metadata};
    }

  auto age = std::max<std::int64_t>(0, trustgate::utils::DateUtils::days_between(*metadata.created, time_source->now()));
  logger->debug("{} was created {} days ago", image.reference, age);

  co_return RecencyAssessment{score_age(age), metadata};
}

EvaluatorResult
RecencyEvaluator::score_age(std::int64_t age_days) const
{
  auto threshold = recency_threshold.count();

  if (age_days <= threshold)
    {
      return EvaluatorResult(Criterion::Recency,
                             trustgate::max_points(Criterion::Recency),
                             fmt::format("Last published {} days ago (within {}d threshold)", age_days, threshold));
    }
  if (age_days <= stale_threshold.count())
    {
      return EvaluatorResult(Criterion::Recency,
                             5,
                             fmt::format("Last published {} days ago (older than {}d but within 1 year)", age_days, threshold));
    }
  return EvaluatorResult(Criterion::Recency, 0, fmt::format("Last published {} days ago (STALE: over 1 year old)", age_days));
}

trustgate::ImageMetadata
RecencyEvaluator::to_metadata(const trustgate::ImageInspection &inspection)
{
  constexpr double bytes_per_mb = 1024.0 * 1024.0;

  trustgate::ImageMetadata metadata;
  metadata.created = inspection.created;
  metadata.digest = inspection.digest;
  metadata.layers = inspection.layer_count;
  if (inspection.size_bytes)
    {
      metadata.size_mb = static_cast<double>(*inspection.size_bytes) / bytes_per_mb;
    }
  return metadata;
}
