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

#include "VendorTrustEvaluator.hh"

#include <utility>

#include <fmt/format.h>

using trustgate::Criterion;
using trustgate::EvaluatorResult;

VendorTrustEvaluator::VendorTrustEvaluator(std::set<std::string> trusted_registries, std::set<std::string> trusted_namespaces)
  : trusted_registries(std::move(trusted_registries))
  , trusted_namespaces(std::move(trusted_namespaces))
{
}

VendorAssessment
VendorTrustEvaluator::evaluate(const trustgate::ImageReference &image) const
{
  constexpr auto points = trustgate::max_points(Criterion::Vendor);

  if (trusted_registries.contains(image.registry))
    {
      logger->debug("registry {} is trusted", image.registry);
      return {EvaluatorResult(Criterion::Vendor, points, fmt::format("Registry {} is a trusted vendor registry", image.registry)),
              true};
    }

  if (trusted_namespaces.contains(image.namespace_name))
    {
      logger->debug("namespace {} is trusted", image.namespace_name);
      return {EvaluatorResult(Criterion::Vendor, points, fmt::format("{} is a known trusted vendor", image.namespace_name)), true};
    }

  logger->info("{} is not a known vendor", image.namespace_name);
  return {EvaluatorResult(Criterion::Vendor,
                          0,
                          fmt::format("{} is NOT a known trusted vendor (unknown vendors require human review)", image.namespace_name)),
          false};
}
