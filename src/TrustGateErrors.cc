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

#include "trustgate/TrustGateErrors.hh"

using namespace trustgate;

namespace
{
  class TrustGateErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept final
    {
      return "trustgate";
    }

    std::string message(int ev) const final
    {
      switch (static_cast<TrustGateErrc>(ev))
        {
        case TrustGateErrc::Success:
          return "success";
        case TrustGateErrc::InvalidArgument:
          return "invalid argument";
        case TrustGateErrc::InvalidConfiguration:
          return "invalid configuration";
        case TrustGateErrc::EvaluationCancelled:
          return "evaluation cancelled";
        case TrustGateErrc::InternalError:
          return "internal error";
        }
      return "(unknown)";
    }
  };

  const TrustGateErrorCategory globalTrustGateErrorCategory{};
} // namespace

std::error_code
trustgate::make_error_code(TrustGateErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalTrustGateErrorCategory};
}
