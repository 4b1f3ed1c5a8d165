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

#include "SignatureEvaluator.hh"

#include <utility>

using trustgate::Criterion;
using trustgate::EvaluatorResult;
using trustgate::SignatureStatus;

SignatureEvaluator::SignatureEvaluator(std::shared_ptr<trustgate::SignatureVerifier> verifier)
  : verifier(std::move(verifier))
{
}

boost::asio::awaitable<EvaluatorResult>
SignatureEvaluator::evaluate(const trustgate::ImageReference &image)
{
  auto status = co_await verifier->verify(image);
  auto result = score(status);
  logger->debug("signature of {}: {}", image.reference, result.detail());
  co_return result;
}

EvaluatorResult
SignatureEvaluator::score(SignatureStatus status)
{
  switch (status)
    {
    case SignatureStatus::Verified:
      return EvaluatorResult(Criterion::Signature, trustgate::max_points(Criterion::Signature), "cosign signature verified (Sigstore)");
    case SignatureStatus::NotVerified:
      return EvaluatorResult(Criterion::Signature, 0, "No cosign signature found (not signed or verification failed)");
    case SignatureStatus::Unavailable:
      break;
    }
  return EvaluatorResult(Criterion::Signature, 0, "cosign not available — skipping signature check");
}
