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

#ifndef TRUSTGATE_REPORT_HH
#define TRUSTGATE_REPORT_HH

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "trustgate/ImageReference.hh"
#include "utils/Enum.hh"

namespace trustgate
{
  enum class Criterion
  {
    Vendor,
    Recency,
    Adoption,
    VulnerabilityCritical,
    VulnerabilityHigh,
    Signature,
  };

  enum class Decision
  {
    AutoApprove,
    NeedsHumanReview,
    AutoReject,
  };

  constexpr int max_points(Criterion criterion)
  {
    switch (criterion)
      {
      case Criterion::Vendor:
        return 30;
      case Criterion::Recency:
        return 15;
      case Criterion::Adoption:
        return 15;
      case Criterion::VulnerabilityCritical:
        return 20;
      case Criterion::VulnerabilityHigh:
        return 10;
      case Criterion::Signature:
        return 10;
      }
    return 0;
  }

  constexpr int max_score = 100;

  class EvaluatorResult
  {
  public:
    EvaluatorResult(Criterion criterion, int points, std::string detail);

    Criterion criterion() const
    {
      return criterion_;
    }

    int points() const
    {
      return points_;
    }

    int max_points() const
    {
      return trustgate::max_points(criterion_);
    }

    const std::string &detail() const
    {
      return detail_;
    }

  private:
    Criterion criterion_;
    int points_;
    std::string detail_;
  };

  struct VulnerabilityCounts
  {
    std::int64_t critical{0};
    std::int64_t high{0};
    std::int64_t medium{0};
    std::int64_t low{0};

    bool operator==(const VulnerabilityCounts &other) const = default;
  };

  struct ImageMetadata
  {
    std::optional<std::chrono::system_clock::time_point> created;
    std::optional<double> size_mb;
    std::optional<std::int64_t> layers;
    std::optional<std::string> digest;
  };

  struct EvaluationReport
  {
    ImageReference image;
    std::chrono::system_clock::time_point timestamp;
    std::vector<EvaluatorResult> results;
    int total_score{0};
    int max_score{trustgate::max_score};
    bool vendor_known{false};
    Decision decision{Decision::AutoReject};
    VulnerabilityCounts vulnerabilities;
    ImageMetadata metadata;

    const EvaluatorResult *result(Criterion criterion) const;
  };
} // namespace trustgate

template<>
struct trustgate::utils::enum_traits<trustgate::Criterion>
{
  static constexpr auto min = trustgate::Criterion::Vendor;
  static constexpr auto max = trustgate::Criterion::Signature;
  static constexpr auto linear = true;

  static constexpr std::array<std::pair<std::string_view, trustgate::Criterion>, 6> names{
    {{"vendor_trust", trustgate::Criterion::Vendor},
     {"recency", trustgate::Criterion::Recency},
     {"adoption", trustgate::Criterion::Adoption},
     {"cve_critical", trustgate::Criterion::VulnerabilityCritical},
     {"cve_high", trustgate::Criterion::VulnerabilityHigh},
     {"signature", trustgate::Criterion::Signature}}};
};

template<>
struct trustgate::utils::enum_traits<trustgate::Decision>
{
  static constexpr auto min = trustgate::Decision::AutoApprove;
  static constexpr auto max = trustgate::Decision::AutoReject;
  static constexpr auto linear = true;

  static constexpr std::array<std::pair<std::string_view, trustgate::Decision>, 3> names{
    {{"auto-approve", trustgate::Decision::AutoApprove},
     {"needs-human-review", trustgate::Decision::NeedsHumanReview},
     {"auto-reject", trustgate::Decision::AutoReject}}};
};

#endif // TRUSTGATE_REPORT_HH
