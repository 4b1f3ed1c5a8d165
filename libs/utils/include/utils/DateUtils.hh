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

#ifndef UTILS_DATE_UTILS_HH
#define UTILS_DATE_UTILS_HH

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace trustgate::utils
{
  class DateUtils
  {
  public:
    // Accepts RFC 3339 timestamps as produced by registries and skopeo,
    // e.g. "2024-01-15T10:30:45.123456789Z" or "2024-01-15T12:30:45+02:00".
    static std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string &date_str);

    static std::string format_rfc3339(std::chrono::system_clock::time_point tp);

    // Whole days elapsed from `from` to `to`, rounded down.
    static std::int64_t days_between(std::chrono::system_clock::time_point from, std::chrono::system_clock::time_point to);

  private:
    static std::optional<boost::posix_time::ptime> try_parse(const std::string &date_str, const std::string &format);
    static std::optional<std::chrono::seconds> parse_utc_offset(const std::string &zone);
  };
} // namespace trustgate::utils

#endif // UTILS_DATE_UTILS_HH
