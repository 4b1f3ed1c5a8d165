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

#include "AdoptionEvaluator.hh"

#include <utility>

AdoptionEvaluator::AdoptionEvaluator(std::shared_ptr<AdoptionStrategy> default_strategy)
  : default_strategy(std::move(default_strategy))
{
}

void
AdoptionEvaluator::register_strategy(const std::string &registry, std::shared_ptr<AdoptionStrategy> strategy)
{
  strategies[registry] = std::move(strategy);
}

boost::asio::awaitable<trustgate::EvaluatorResult>
AdoptionEvaluator::evaluate(const trustgate::ImageReference &image)
{
  auto strategy = default_strategy;

  auto it = strategies.find(image.registry);
  if (it != strategies.end())
    {
      strategy = it->second;
    }
  else
    {
      logger->debug("no adoption strategy for {}", image.registry);
    }

  auto result = co_await strategy->assess(image);
  logger->debug("adoption of {}: {} ({})", image.reference, result.points(), result.detail());
  co_return result;
}
