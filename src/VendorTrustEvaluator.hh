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

#ifndef VENDOR_TRUST_EVALUATOR_HH
#define VENDOR_TRUST_EVALUATOR_HH

#include <memory>
#include <set>
#include <string>

#include <spdlog/spdlog.h>

#include "trustgate/ImageReference.hh"
#include "trustgate/Report.hh"
#include "utils/Logging.hh"

struct VendorAssessment
{
  trustgate::EvaluatorResult result;
  bool vendor_known{false};
};

class VendorTrustEvaluator
{
public:
  VendorTrustEvaluator(std::set<std::string> trusted_registries, std::set<std::string> trusted_namespaces);

  VendorAssessment evaluate(const trustgate::ImageReference &image) const;

private:
  std::set<std::string> trusted_registries;
  std::set<std::string> trusted_namespaces;
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:vendor")};
};

#endif // VENDOR_TRUST_EVALUATOR_HH
