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

#include "SkopeoInspector.hh"

#include <utility>

#include <boost/json.hpp>

#include "utils/DateUtils.hh"

#include "JsonUtils.hh"
#include "ToolErrors.hh"

SkopeoInspector::SkopeoInspector(std::shared_ptr<ToolRunner> runner, std::string command, std::chrono::seconds timeout)
  : runner(std::move(runner))
  , command(std::move(command))
  , timeout(timeout)
{
}

boost::asio::awaitable<outcome::std_result<trustgate::ImageInspection>>
SkopeoInspector::inspect(const trustgate::ImageReference &image)
{
  auto rc = co_await runner->run(command, {"inspect", "docker://" + image.reference}, timeout);
  if (!rc)
    {
      co_return rc.as_failure();
    }

  auto &result = rc.value();
  if (result.exit_code != 0)
    {
      logger->info("skopeo inspect {} exited with {}", image.reference, result.exit_code);
      co_return ToolErrc::Failed;
    }

  co_return parse_inspection(result.output);
}

outcome::std_result<trustgate::ImageInspection>
SkopeoInspector::parse_inspection(const std::string &json)
{
  boost::system::error_code ec;
  auto doc = boost::json::parse(json, ec);
  if (ec || !doc.is_object())
    {
      logger->error("failed to parse skopeo output ({})", ec.message());
      return ToolErrc::InvalidOutput;
    }

  JsonUtils json_utils;
  trustgate::ImageInspection inspection;

  if (auto created = json_utils.extract_string(doc, "Created"))
    {
      inspection.created = trustgate::utils::DateUtils::parse_rfc3339(*created);
      if (!inspection.created)
        {
          logger->warn("unparseable creation date '{}'", *created);
        }
    }

  inspection.digest = json_utils.extract_string(doc, "Digest");

  if (json_utils.extract_array(doc, "Layers") != nullptr)
    {
      inspection.layer_count = static_cast<std::int64_t>(json_utils.extract_length(doc, "Layers"));
    }

  if (const auto *layers = json_utils.extract_array(doc, "LayersData"))
    {
      std::int64_t size = 0;
      for (const auto &layer: *layers)
        {
          size += json_utils.extract_integer(layer, "Size").value_or(0);
        }
      inspection.size_bytes = size;
    }

  return inspection;
}
