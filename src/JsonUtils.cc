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

#include "JsonUtils.hh"

std::optional<std::string>
JsonUtils::extract_string(const boost::json::value &json_val, const std::string &key)
{
  if (const auto *obj = json_val.if_object())
    {
      const auto *member = obj->if_contains(key);
      if (member != nullptr && member->is_string())
        {
          return std::string(member->as_string());
        }
    }
  return {};
}

std::optional<std::int64_t>
JsonUtils::extract_integer(const boost::json::value &json_val, const std::string &key)
{
  const auto *obj = json_val.if_object();
  if (obj == nullptr)
    {
      return {};
    }

  const auto *member = obj->if_contains(key);
  if (member == nullptr)
    {
      return {};
    }

  boost::system::error_code ec;
  auto value = member->to_number<std::int64_t>(ec);
  if (ec)
    {
      logger->debug("JSON member '{}' is not an integer ({})", key, ec.message());
      return {};
    }
  return value;
}

const boost::json::array *
JsonUtils::extract_array(const boost::json::value &json_val, const std::string &key)
{
  if (const auto *obj = json_val.if_object())
    {
      const auto *member = obj->if_contains(key);
      if (member != nullptr)
        {
          return member->if_array();
        }
    }
  return nullptr;
}

std::size_t
JsonUtils::extract_length(const boost::json::value &json_val, const std::string &key)
{
  if (const auto *obj = json_val.if_object())
    {
      const auto *member = obj->if_contains(key);
      if (member != nullptr)
        {
          if (const auto *arr = member->if_array())
            {
              return arr->size();
            }
          if (const auto *o = member->if_object())
            {
              return o->size();
            }
        }
    }
  return 0;
}
