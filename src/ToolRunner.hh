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

#ifndef TOOL_RUNNER_HH
#define TOOL_RUNNER_HH

#include <chrono>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

struct ToolOutput
{
  int exit_code{0};
  std::string output;
};

class ToolRunner
{
public:
  virtual ~ToolRunner() = default;

  // Runs `tool` with `args`, collecting standard output. Fails with
  // ToolErrc::NotFound, LaunchFailed or Timeout; a non-zero exit code is
  // not an error at this level.
  virtual boost::asio::awaitable<outcome::std_result<ToolOutput>> run(std::string tool,
                                                                       std::vector<std::string> args,
                                                                       std::chrono::seconds timeout) = 0;
};

#endif // TOOL_RUNNER_HH
