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

#ifndef TRUSTGATE_REPORT_FORMATTER_HH
#define TRUSTGATE_REPORT_FORMATTER_HH

#include <string>

#include <boost/json.hpp>

#include "trustgate/Report.hh"

namespace trustgate
{
  // Process exit code when no report could be produced.
  constexpr int failure_exit_code = 3;

  int exit_code(Decision decision);

  boost::json::object to_json(const EvaluationReport &report);

  // Indented JSON document terminated by a newline.
  std::string format_json(const EvaluationReport &report);

  std::string format_text(const EvaluationReport &report);
} // namespace trustgate

#endif // TRUSTGATE_REPORT_FORMATTER_HH
