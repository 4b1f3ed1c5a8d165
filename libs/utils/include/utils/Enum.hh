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

#ifndef UTILS_ENUM_HH
#define UTILS_ENUM_HH

#include <algorithm>
#include <iterator>
#include <optional>
#include <ostream>
#include <string_view>
#include <type_traits>

#include <boost/iterator/iterator_facade.hpp>
#include <boost/range/iterator_range.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

namespace trustgate::utils
{
  template<typename Enum>
  constexpr auto underlying_cast(Enum e) noexcept
  {
    return static_cast<std::underlying_type_t<Enum>>(e);
  }

  // Specialize with `min`, `max` and/or `names` to enable the helpers below.
  template<typename Enum>
  struct enum_traits
  {
  };

  template<typename Enum, typename = std::void_t<>>
  struct enum_has_names : std::false_type
  {
  };

  template<typename Enum>
  struct enum_has_names<Enum, std::void_t<decltype(enum_traits<Enum>::names)>> : std::true_type
  {
  };

  template<typename Enum>
  constexpr inline bool enum_has_names_v = enum_has_names<Enum>::value;

  template<typename Enum>
  constexpr auto enum_min_value() noexcept
  {
    return underlying_cast(enum_traits<Enum>::min);
  }

  template<typename Enum>
  constexpr auto enum_max_value() noexcept
  {
    return underlying_cast(enum_traits<Enum>::max);
  }

  template<typename Enum>
  constexpr auto enum_count() noexcept
  {
    return enum_max_value<Enum>() - enum_min_value<Enum>() + 1;
  }

  template<typename Enum>
  std::string_view enum_to_string(Enum e)
  {
    auto &names = enum_traits<Enum>::names;
    const auto it = std::find_if(std::begin(names), std::end(names), [&e](const auto &v) { return v.second == e; });
    if (it == std::end(names))
      {
        return {};
      }
    return it->first;
  }

  template<typename Enum>
  std::optional<Enum> enum_from_string(std::string_view key)
  {
    auto &names = enum_traits<Enum>::names;
    const auto it = std::find_if(std::begin(names), std::end(names), [&key](const auto &v) { return v.first == key; });
    if (it == std::end(names))
      {
        return std::nullopt;
      }
    return it->second;
  }

  template<typename Enum>
  class enum_iterator : public boost::iterator_facade<enum_iterator<Enum>, Enum, boost::random_access_traversal_tag, Enum>
  {
  public:
    constexpr enum_iterator()
      : index{enum_max_value<Enum>() + 1}
    {
    }

    constexpr explicit enum_iterator(std::underlying_type_t<Enum> value)
      : index{value}
    {
    }

  private:
    void advance(std::ptrdiff_t n)
    {
      index += n;
    }

    void decrement()
    {
      --index;
    }

    void increment()
    {
      ++index;
    }

    std::ptrdiff_t distance_to(const enum_iterator &other) const
    {
      return other.index - index;
    }

    bool equal(const enum_iterator &other) const
    {
      return other.index == index;
    }

    Enum dereference() const
    {
      return static_cast<Enum>(index);
    }

    friend class boost::iterator_core_access;

  private:
    std::underlying_type_t<Enum> index;
  };

  template<typename Enum>
  constexpr auto enum_range() noexcept
  {
    return boost::make_iterator_range(enum_iterator<Enum>{enum_min_value<Enum>()},
                                      enum_iterator<Enum>{enum_max_value<Enum>() + 1});
  }
} // namespace trustgate::utils

template<typename Enum>
requires trustgate::utils::enum_has_names_v<Enum>
std::ostream &
operator<<(std::ostream &stream, const Enum e)
{
  stream << trustgate::utils::enum_to_string(e);
  return stream;
}

template<typename Enum>
requires trustgate::utils::enum_has_names_v<Enum>
struct fmt::formatter<Enum> : fmt::formatter<std::string_view>
{
  auto format(Enum e, format_context &ctx) const
  {
    return fmt::formatter<std::string_view>::format(trustgate::utils::enum_to_string<Enum>(e), ctx);
  }
};

#endif // UTILS_ENUM_HH
