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

#include "trustgate/Report.hh"

#include <algorithm>
#include <utility>

using namespace trustgate;

EvaluatorResult::EvaluatorResult(Criterion criterion, int points, std::string detail)
  : criterion_(criterion)
  , points_(std::clamp(points, 0, trustgate::max_points(criterion)))
  , detail_(std::move(detail))
{
}

const EvaluatorResult *
EvaluationReport::result(Criterion criterion) const
{
  auto it = std::find_if(results.begin(), results.end(), [criterion](const auto &r) { return r.criterion() == criterion; });
  if (it == results.end())
    {
      return nullptr;
    }
  return &*it;
}
