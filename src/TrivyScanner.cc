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

#include "TrivyScanner.hh"

#include <utility>

#include <boost/json.hpp>

#include "JsonUtils.hh"
#include "ToolErrors.hh"

TrivyScanner::TrivyScanner(std::shared_ptr<ToolRunner> runner, std::string command, std::chrono::seconds timeout)
  : runner(std::move(runner))
  , command(std::move(command))
  , timeout(timeout)
{
}

boost::asio::awaitable<outcome::std_result<trustgate::VulnerabilityCounts>>
TrivyScanner::scan(const trustgate::ImageReference &image)
{
  auto rc = co_await runner->run(command,
                                 {"image", "--severity", "CRITICAL,HIGH,MEDIUM,LOW", "--format", "json", "--quiet", image.reference},
                                 timeout);
  if (!rc)
    {
      co_return rc.as_failure();
    }

  auto &result = rc.value();
  if (result.exit_code != 0)
    {
      logger->info("trivy scan of {} exited with {}", image.reference, result.exit_code);
      co_return ToolErrc::Failed;
    }

  co_return parse_report(result.output);
}

outcome::std_result<trustgate::VulnerabilityCounts>
TrivyScanner::parse_report(const std::string &json)
{
  boost::system::error_code ec;
  auto doc = boost::json::parse(json, ec);
  if (ec || !doc.is_object() || doc.as_object().empty())
    {
      logger->error("trivy returned no usable report ({})", ec.message());
      return ToolErrc::InvalidOutput;
    }

  JsonUtils json_utils;
  trustgate::VulnerabilityCounts counts;

  const auto *results = json_utils.extract_array(doc, "Results");
  if (results == nullptr)
    {
      return counts;
    }

  for (const auto &target: *results)
    {
      const auto *vulnerabilities = json_utils.extract_array(target, "Vulnerabilities");
      if (vulnerabilities == nullptr)
        {
          continue;
        }

      for (const auto &vulnerability: *vulnerabilities)
        {
          auto severity = json_utils.extract_string(vulnerability, "Severity").value_or("");
          if (severity == "CRITICAL")
            {
              counts.critical++;
            }
          else if (severity == "HIGH")
            {
              counts.high++;
            }
          else if (severity == "MEDIUM")
            {
              counts.medium++;
            }
          else if (severity == "LOW")
            {
              counts.low++;
            }
        }
    }

  logger->debug("critical={} high={} medium={} low={}", counts.critical, counts.high, counts.medium, counts.low);
  return counts;
}
