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

#ifndef TRUSTGATE_TRUSTGATE_HH
#define TRUSTGATE_TRUSTGATE_HH

#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include "trustgate/EvaluationConfig.hh"
#include "trustgate/Report.hh"
#include "trustgate/TrustGateErrors.hh"

namespace trustgate
{
  namespace outcome = boost::outcome_v2;

  class TrustGate
  {
  public:
    TrustGate() = default;
    virtual ~TrustGate() = default;

    // Evaluator backed by the skopeo, trivy and cosign tools and the public registry APIs.
    static std::shared_ptr<TrustGate> create(boost::asio::io_context &ioc, EvaluationConfig config);

    // Runs all trust checks for one image. Fails with InvalidArgument for an
    // empty reference and with EvaluationCancelled when the deadline expires
    // or the operation is cancelled; a report is only returned when complete.
    virtual boost::asio::awaitable<outcome::std_result<EvaluationReport>> evaluate(std::string reference) = 0;
  };
} // namespace trustgate

#endif // TRUSTGATE_TRUSTGATE_HH
