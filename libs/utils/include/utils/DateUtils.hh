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

#ifndef OPENCRED_UTILS_DATE_UTILS_HH
#define OPENCRED_UTILS_DATE_UTILS_HH

#include <chrono>
#include <optional>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace opencred::utils
{
  class DateUtils
  {
  public:
    /// Parses RFC 3339 / ISO 8601 timestamps ("2015-01-01", "2015-01-01T10:00:00Z",
    /// "2015-01-01T10:00:00.123+02:00", ...) and RFC 1123 dates. Throws std::runtime_error.
    ///
    /// The result has second precision so that every year up to 9999 is representable.
    static std::chrono::sys_seconds parse_time_point(const std::string &date_str);

    static std::optional<std::chrono::sys_seconds> try_parse_time_point(const std::string &date_str);

    /// Converts milliseconds since the epoch, rejecting values outside
    /// +/- 8.64e15 ms (100 million days) and non-finite values.
    static std::optional<std::chrono::sys_seconds> from_epoch_milliseconds(double ms);

  private:
    static std::optional<boost::posix_time::ptime> try_parse(const std::string &date_str, const std::string &format);
    static std::optional<std::chrono::seconds> split_utc_offset(std::string &date_str);
  };
} // namespace opencred::utils

#endif // OPENCRED_UTILS_DATE_UTILS_HH
