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

#ifndef TRUSTGATE_IMAGE_REFERENCE_HH
#define TRUSTGATE_IMAGE_REFERENCE_HH

#include <string>
#include <string_view>

namespace trustgate
{
  struct ImageReference
  {
    // Trimmed input; this is what the inspection tools receive.
    std::string reference;
    std::string registry;
    std::string namespace_name;
    std::string repository;
    std::string tag;
    std::string digest;
    // The repository path had one segment, as in `nginx` or `docker.io/nginx`.
    bool single_segment = false;

    bool operator==(const ImageReference &other) const = default;
  };

  // Splits an image reference into its parts. Never fails; malformed input
  // results in empty or default fields.
  ImageReference parse_image_reference(std::string_view input);
} // namespace trustgate

#endif // TRUSTGATE_IMAGE_REFERENCE_HH
