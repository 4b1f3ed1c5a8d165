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

#ifndef TRUSTGATE_CAPABILITIES_HH
#define TRUSTGATE_CAPABILITIES_HH

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include "trustgate/ImageReference.hh"
#include "trustgate/Report.hh"

namespace trustgate
{
  namespace outcome = boost::outcome_v2;

  struct ImageInspection
  {
    std::optional<std::chrono::system_clock::time_point> created;
    std::optional<std::string> digest;
    std::optional<std::int64_t> layer_count;
    std::optional<std::int64_t> size_bytes;
  };

  enum class SignatureStatus
  {
    Verified,
    NotVerified,
    Unavailable,
  };

  class ImageInspector
  {
  public:
    virtual ~ImageInspector() = default;
    virtual boost::asio::awaitable<outcome::std_result<ImageInspection>> inspect(const ImageReference &image) = 0;
  };

  class VulnerabilityScanner
  {
  public:
    virtual ~VulnerabilityScanner() = default;
    virtual boost::asio::awaitable<outcome::std_result<VulnerabilityCounts>> scan(const ImageReference &image) = 0;
  };

  class SignatureVerifier
  {
  public:
    virtual ~SignatureVerifier() = default;
    virtual boost::asio::awaitable<SignatureStatus> verify(const ImageReference &image) = 0;
  };
} // namespace trustgate

#endif // TRUSTGATE_CAPABILITIES_HH
