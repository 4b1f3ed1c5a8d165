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

#ifndef SKOPEO_INSPECTOR_HH
#define SKOPEO_INSPECTOR_HH

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "trustgate/Capabilities.hh"
#include "utils/Logging.hh"

#include "ToolRunner.hh"

class SkopeoInspector : public trustgate::ImageInspector
{
public:
  SkopeoInspector(std::shared_ptr<ToolRunner> runner, std::string command, std::chrono::seconds timeout);

  boost::asio::awaitable<outcome::std_result<trustgate::ImageInspection>> inspect(const trustgate::ImageReference &image) override;

  outcome::std_result<trustgate::ImageInspection> parse_inspection(const std::string &json);

private:
  std::shared_ptr<ToolRunner> runner;
  std::string command;
  std::chrono::seconds timeout;
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:skopeo")};
};

#endif // SKOPEO_INSPECTOR_HH
