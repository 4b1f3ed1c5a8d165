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

#include "utils/DateUtils.hh"

#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <chrono>
#include <locale>
#include <sstream>

using namespace trustgate::utils;

std::optional<boost::posix_time::ptime>
DateUtils::try_parse(const std::string &date_str, const std::string &format)
{
  std::locale locale(std::locale::classic(), new boost::posix_time::time_input_facet(format));
  std::istringstream iss(date_str);
  iss.imbue(locale);

  boost::posix_time::ptime pt;
  iss >> pt;

  if (!iss.fail() && pt != boost::posix_time::ptime())
    {
      return pt;
    }
  return std::nullopt;
}

std::optional<std::chrono::seconds>
DateUtils::parse_utc_offset(const std::string &zone)
{
  if (zone.empty() || zone == "Z" || zone == "z")
    {
      return std::chrono::seconds(0);
    }

  // [+-]HH:MM or [+-]HHMM
  if (zone.size() < 5 || (zone[0] != '+' && zone[0] != '-'))
    {
      return std::nullopt;
    }

  std::string digits;
  for (auto c: zone.substr(1))
    {
      if (c == ':')
        {
          continue;
        }
      if (c < '0' || c > '9')
        {
          return std::nullopt;
        }
      digits += c;
    }
  if (digits.size() != 4)
    {
      return std::nullopt;
    }

  auto hours = std::stoi(digits.substr(0, 2));
  auto minutes = std::stoi(digits.substr(2, 2));
  std::chrono::seconds offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
  return zone[0] == '-' ? -offset : offset;
}

std::optional<std::chrono::system_clock::time_point>
DateUtils::parse_rfc3339(const std::string &date_str)
{
  auto str = boost::algorithm::trim_copy(date_str);

  auto time_sep = str.find_first_of("Tt ");
  if (time_sep == std::string::npos)
    {
      return std::nullopt;
    }

  // Split off the zone designator, which follows the seconds (and fraction).
  std::string zone;
  auto zone_pos = str.find_first_of("Zz+-", time_sep);
  if (zone_pos != std::string::npos)
    {
      zone = str.substr(zone_pos);
      str.erase(zone_pos);
    }

  // The fraction is dropped, day granularity is all callers need.
  auto fraction_pos = str.find('.', time_sep);
  if (fraction_pos != std::string::npos)
    {
      str.erase(fraction_pos);
    }
  str[time_sep] = 'T';

  auto offset = parse_utc_offset(zone);
  if (!offset)
    {
      return std::nullopt;
    }

  auto pt = try_parse(str, "%Y-%m-%dT%H:%M:%S");
  if (!pt)
    {
      return std::nullopt;
    }

  boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
  boost::posix_time::time_duration duration = *pt - epoch;
  return std::chrono::system_clock::time_point(std::chrono::seconds(duration.total_seconds()) - *offset);
}

std::string
DateUtils::format_rfc3339(std::chrono::system_clock::time_point tp)
{
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  auto pt = boost::posix_time::from_time_t(static_cast<std::time_t>(seconds));
  return boost::posix_time::to_iso_extended_string(pt) + "Z";
}

std::int64_t
DateUtils::days_between(std::chrono::system_clock::time_point from, std::chrono::system_clock::time_point to)
{
  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(to - from);
  auto days = std::chrono::floor<std::chrono::days>(elapsed);
  return days.count();
}
