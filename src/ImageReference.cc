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

#include "trustgate/ImageReference.hh"

#include <vector>

#include <boost/algorithm/string.hpp>

using namespace trustgate;

namespace
{
  constexpr std::string_view default_registry = "docker.io";
  constexpr std::string_view default_tag = "latest";
} // namespace

ImageReference
trustgate::parse_image_reference(std::string_view input)
{
  ImageReference image;
  image.reference = boost::algorithm::trim_copy(std::string(input));
  image.tag = default_tag;

  std::string remainder = image.reference;
  if (remainder.empty())
    {
      return image;
    }

  auto at_pos = remainder.find('@');
  if (at_pos != std::string::npos)
    {
      image.digest = remainder.substr(at_pos + 1);
      remainder.resize(at_pos);
    }

  auto last_slash = remainder.rfind('/');
  auto colon_pos = remainder.rfind(':');
  if (colon_pos != std::string::npos && (last_slash == std::string::npos || colon_pos > last_slash))
    {
      auto tag = remainder.substr(colon_pos + 1);
      if (!tag.empty())
        {
          image.tag = tag;
        }
      remainder.resize(colon_pos);
    }

  std::vector<std::string> segments;
  boost::algorithm::split(segments, remainder, boost::is_any_of("/"));

  // A registry host is only recognised in references that look like
  // host/namespace/repository or whose first segment contains a dot.
  bool has_registry = segments.size() >= 3 || (segments.size() == 2 && segments[0].find('.') != std::string::npos);
  if (has_registry)
    {
      image.registry = segments.front();
      segments.erase(segments.begin());
    }
  else
    {
      image.registry = default_registry;
    }

  if (segments.empty())
    {
      return image;
    }

  image.namespace_name = segments.front();
  if (segments.size() == 1)
    {
      image.single_segment = true;
      image.repository = segments.front();
    }
  else
    {
      image.repository = boost::algorithm::join(std::vector<std::string>(segments.begin() + 1, segments.end()), "/");
    }
  return image;
}
