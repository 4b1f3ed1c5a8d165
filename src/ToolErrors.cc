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

#include "ToolErrors.hh"

namespace
{
  struct ToolErrorCategory : std::error_category
  {
    const char *name() const noexcept override
    {
      return "trustgate-tool";
    }
    std::string message(int ev) const override;
  };

  std::string ToolErrorCategory::message(int ev) const
  {
    switch (static_cast<ToolErrc>(ev))
      {
      case ToolErrc::Success:
        return "success";
      case ToolErrc::NotFound:
        return "tool not found";
      case ToolErrc::LaunchFailed:
        return "failed to launch tool";
      case ToolErrc::Timeout:
        return "tool timed out";
      case ToolErrc::Failed:
        return "tool failed";
      case ToolErrc::InvalidOutput:
        return "invalid tool output";
      }
    return "(unknown)";
  }

  const ToolErrorCategory globalToolErrorCategory{};
} // namespace

std::error_code
make_error_code(ToolErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalToolErrorCategory};
}
