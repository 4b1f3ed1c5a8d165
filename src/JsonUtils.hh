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

#ifndef JSON_UTILS_HH
#define JSON_UTILS_HH

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/Logging.hh"

class JsonUtils
{
public:
  JsonUtils() = default;

  std::optional<std::string> extract_string(const boost::json::value &json_val, const std::string &key);
  std::optional<std::int64_t> extract_integer(const boost::json::value &json_val, const std::string &key);
  const boost::json::array *extract_array(const boost::json::value &json_val, const std::string &key);

  // Number of members of an array or object member; 0 when absent.
  std::size_t extract_length(const boost::json::value &json_val, const std::string &key);

private:
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:json")};
};

#endif // JSON_UTILS_HH
