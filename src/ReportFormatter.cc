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

#include "trustgate/ReportFormatter.hh"

#include <cmath>
#include <iterator>
#include <sstream>

#include <fmt/format.h>

#include "utils/DateUtils.hh"
#include "utils/Enum.hh"

using namespace trustgate;

namespace
{
  std::string_view criterion_label(Criterion criterion)
  {
    switch (criterion)
      {
      case Criterion::Vendor:
        return "Vendor Trust";
      case Criterion::Recency:
        return "Recency";
      case Criterion::Adoption:
        return "Adoption";
      case Criterion::VulnerabilityCritical:
        return "CVE (Critical)";
      case Criterion::VulnerabilityHigh:
        return "CVE (High)";
      case Criterion::Signature:
        return "Signature";
      }
    return "";
  }

  template<typename T>
  boost::json::value optional_value(const std::optional<T> &value)
  {
    if (value)
      {
        return boost::json::value_from(*value);
      }
    return nullptr;
  }

  void pretty_print(std::ostream &os, const boost::json::value &jv, std::string &indent)
  {
    switch (jv.kind())
      {
      case boost::json::kind::object:
        {
          const auto &obj = jv.get_object();
          if (obj.empty())
            {
              os << "{}";
              break;
            }
          os << "{\n";
          indent.append(2, ' ');
          auto it = obj.begin();
          for (;;)
            {
              os << indent << boost::json::serialize(it->key()) << ": ";
              pretty_print(os, it->value(), indent);
              if (++it == obj.end())
                {
                  break;
                }
              os << ",\n";
            }
          os << "\n";
          indent.resize(indent.size() - 2);
          os << indent << "}";
          break;
        }

      case boost::json::kind::array:
        {
          const auto &arr = jv.get_array();
          if (arr.empty())
            {
              os << "[]";
              break;
            }
          os << "[\n";
          indent.append(2, ' ');
          auto it = arr.begin();
          for (;;)
            {
              os << indent;
              pretty_print(os, *it, indent);
              if (++it == arr.end())
                {
                  break;
                }
              os << ",\n";
            }
          os << "\n";
          indent.resize(indent.size() - 2);
          os << indent << "]";
          break;
        }

      default:
        os << boost::json::serialize(jv);
        break;
      }
  }
} // namespace

int
trustgate::exit_code(Decision decision)
{
  switch (decision)
    {
    case Decision::AutoApprove:
      return 0;
    case Decision::NeedsHumanReview:
      return 1;
    case Decision::AutoReject:
      return 2;
    }
  return failure_exit_code;
}

boost::json::object
trustgate::to_json(const EvaluationReport &report)
{
  boost::json::object scores;
  for (const auto &result: report.results)
    {
      scores[utils::enum_to_string(result.criterion())] = {
        {"points", result.points()},
        {"max", result.max_points()},
        {"detail", result.detail()},
      };
    }

  boost::json::object metadata;
  if (report.metadata.created)
    {
      metadata["created"] = utils::DateUtils::format_rfc3339(*report.metadata.created);
    }
  else
    {
      metadata["created"] = nullptr;
    }
  if (report.metadata.size_mb)
    {
      metadata["size_mb"] = std::round(*report.metadata.size_mb * 100.0) / 100.0;
    }
  else
    {
      metadata["size_mb"] = nullptr;
    }
  metadata["layers"] = optional_value(report.metadata.layers);
  metadata["digest"] = optional_value(report.metadata.digest);

  boost::json::object doc;
  doc["image"] = report.image.reference;
  doc["timestamp"] = utils::DateUtils::format_rfc3339(report.timestamp);
  doc["registry"] = report.image.registry;
  doc["namespace"] = report.image.namespace_name;
  doc["repository"] = report.image.repository;
  doc["tag"] = report.image.tag;
  doc["scores"] = std::move(scores);
  doc["total_score"] = report.total_score;
  doc["max_score"] = report.max_score;
  doc["vendor_known"] = report.vendor_known;
  doc["decision"] = utils::enum_to_string(report.decision);
  doc["trivy_summary"] = {
    {"critical", report.vulnerabilities.critical},
    {"high", report.vulnerabilities.high},
    {"medium", report.vulnerabilities.medium},
    {"low", report.vulnerabilities.low},
  };
  doc["image_metadata"] = std::move(metadata);
  return doc;
}

std::string
trustgate::format_json(const EvaluationReport &report)
{
  std::ostringstream ss;
  std::string indent;
  pretty_print(ss, to_json(report), indent);
  ss << "\n";
  return ss.str();
}

std::string
trustgate::format_text(const EvaluationReport &report)
{
  std::string out;
  auto inserter = std::back_inserter(out);

  fmt::format_to(inserter, "\n=== Image Registry Evaluation Report ===\n");
  fmt::format_to(inserter, "Image:    {}\n", report.image.reference);
  fmt::format_to(inserter, "Date:     {}\n", utils::DateUtils::format_rfc3339(report.timestamp));
  fmt::format_to(inserter, "\n--- Scores ---\n");
  for (const auto &result: report.results)
    {
      fmt::format_to(inserter, "{:<20} {:>3} / {:>3}  {}\n", criterion_label(result.criterion()), result.points(), result.max_points(), result.detail());
    }
  fmt::format_to(inserter, "\n--- Trivy Summary ---\n");
  fmt::format_to(inserter,
                 "Critical: {} | High: {} | Medium: {} | Low: {}\n",
                 report.vulnerabilities.critical,
                 report.vulnerabilities.high,
                 report.vulnerabilities.medium,
                 report.vulnerabilities.low);
  fmt::format_to(inserter, "\nTOTAL:    {} / {}\n", report.total_score, report.max_score);
  fmt::format_to(inserter, "DECISION: {}\n\n", report.decision);
  return out;
}
