// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
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

#include <boost/date_time/gregorian/gregorian.hpp>
#include <cctype>
#include <cmath>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace opencred::utils;

std::optional<boost::posix_time::ptime>
DateUtils::try_parse(const std::string &date_str, const std::string &format)
{
  boost::posix_time::ptime pt;
  try
    {
      std::locale locale(std::locale::classic(), new boost::posix_time::time_input_facet(format));
      std::istringstream iss(date_str);
      iss.imbue(locale);
      iss >> pt;
    }
  catch (const std::exception &)
    {
      // Out-of-range fields (month 13, day 32, ...).
      return std::nullopt;
    }

  if (pt != boost::posix_time::ptime() && !pt.is_special())
    {
      return pt;
    }
  return std::nullopt;
}

// Removes a trailing 'Z' or '+hh:mm' / '-hh[:]mm' designator and returns its offset from UTC.
std::optional<std::chrono::seconds>
DateUtils::split_utc_offset(std::string &date_str)
{
  if (date_str.empty())
    {
      return std::nullopt;
    }

  if (date_str.back() == 'Z' || date_str.back() == 'z')
    {
      date_str.pop_back();
      return std::chrono::seconds(0);
    }

  auto time_sep = date_str.find_first_of("Tt ");
  if (time_sep == std::string::npos)
    {
      return std::nullopt;
    }

  auto sign_pos = date_str.find_last_of("+-");
  if (sign_pos == std::string::npos || sign_pos < time_sep)
    {
      return std::nullopt;
    }

  std::string designator = date_str.substr(sign_pos + 1);
  std::string digits;
  for (char c: designator)
    {
      if (c == ':')
        {
          continue;
        }
      if (std::isdigit(static_cast<unsigned char>(c)) == 0)
        {
          return std::nullopt;
        }
      digits.push_back(c);
    }

  if (digits.size() != 2 && digits.size() != 4)
    {
      return std::nullopt;
    }

  int hours = std::stoi(digits.substr(0, 2));
  int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
  auto offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);

  bool negative = date_str[sign_pos] == '-';
  date_str.erase(sign_pos);
  return negative ? -std::chrono::duration_cast<std::chrono::seconds>(offset) : std::chrono::duration_cast<std::chrono::seconds>(offset);
}

std::optional<std::chrono::sys_seconds>
DateUtils::try_parse_time_point(const std::string &date_str)
{
  const std::vector<std::string> rfc1123_formats = {
    "%a, %d %b %Y %H:%M:%S GMT", // RFC 1123
  };
  const std::vector<std::string> iso_formats = {
    "%Y-%m-%dT%H:%M:%S", // ISO 8601
    "%Y-%m-%d %H:%M:%S", // ISO 8601, space separated
    "%Y-%m-%dT%H:%M",    // ISO 8601 without seconds
  };

  std::optional<boost::posix_time::ptime> pt;
  std::chrono::seconds offset{0};

  for (const auto &format: rfc1123_formats)
    {
      if (pt = try_parse(date_str, format); pt.has_value())
        {
          break;
        }
    }

  if (!pt)
    {
      std::string local = date_str;
      if (auto utc_offset = split_utc_offset(local); utc_offset.has_value())
        {
          offset = *utc_offset;
        }

      // Sub-second precision is not significant for expiration checks.
      if (auto dot = local.find('.'); dot != std::string::npos)
        {
          local.erase(dot);
        }

      // Date only
      if (local.size() == 10)
        {
          local += "T00:00:00";
        }

      for (const auto &format: iso_formats)
        {
          if (pt = try_parse(local, format); pt.has_value())
            {
              break;
            }
        }
    }

  if (!pt)
    {
      return std::nullopt;
    }

  boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
  boost::posix_time::time_duration duration = *pt - epoch;
  return std::chrono::sys_seconds(std::chrono::seconds(duration.total_seconds()) - offset);
}

std::chrono::sys_seconds
DateUtils::parse_time_point(const std::string &date_str)
{
  auto tp = try_parse_time_point(date_str);
  if (!tp)
    {
      throw std::runtime_error("Failed to parse time string");
    }
  return *tp;
}

std::optional<std::chrono::sys_seconds>
DateUtils::from_epoch_milliseconds(double ms)
{
  constexpr double max_ms = 8.64e15;
  if (!std::isfinite(ms) || std::fabs(ms) > max_ms)
    {
      return std::nullopt;
    }

  auto since_epoch = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
  return std::chrono::sys_seconds(std::chrono::floor<std::chrono::seconds>(since_epoch));
}
