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

#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#if SPDLOG_VERSION >= 10600
#  include <spdlog/pattern_formatter.h>
#endif
#if SPDLOG_VERSION >= 10801
#  include <spdlog/cfg/env.h>
#endif

#include "utils/DateUtils.hh"
#include "utils/Base64.hh"
#include "utils/TimeSource.hh"

using namespace opencred::utils;

struct GlobalFixture : public ::testing::Environment
{
  GlobalFixture() = default;
  ~GlobalFixture() override = default;

  GlobalFixture(const GlobalFixture &) = delete;
  GlobalFixture &operator=(const GlobalFixture &) = delete;
  GlobalFixture(GlobalFixture &&) = delete;
  GlobalFixture &operator=(GlobalFixture &&) = delete;

  void SetUp() override
  {
    const auto *log_file = "opencred-test-utils.log";

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    auto logger{std::make_shared<spdlog::logger>("opencred", std::initializer_list<spdlog::sink_ptr>{file_sink, console_sink})};
    logger->flush_on(spdlog::level::critical);
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%-5l%$] %v");

#if SPDLOG_VERSION >= 10801
    spdlog::cfg::load_env_levels();
#endif
  }

  void TearDown() override
  {
    spdlog::drop_all();
  }
};

::testing::Environment *const global_env = ::testing::AddGlobalTestEnvironment(new GlobalFixture);

namespace
{
  std::chrono::system_clock::time_point make_time_point(std::int64_t seconds_since_epoch)
  {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds_since_epoch));
  }
} // namespace

TEST(UtilsTest, utils_base64_encode)
{
  EXPECT_EQ(Base64::encode(""), "");
  EXPECT_EQ(Base64::encode("f"), "Zg==");
  EXPECT_EQ(Base64::encode("fo"), "Zm8=");
  EXPECT_EQ(Base64::encode("foo"), "Zm9v");
  EXPECT_EQ(Base64::encode("foobar"), "Zm9vYmFy");
}

TEST(UtilsTest, utils_base64_decode)
{
  EXPECT_EQ(Base64::decode(""), "");
  EXPECT_EQ(Base64::decode("Zg=="), "f");
  EXPECT_EQ(Base64::decode("Zm8="), "fo");
  EXPECT_EQ(Base64::decode("Zm9v"), "foo");
  EXPECT_EQ(Base64::decode("Zm9vYmFy"), "foobar");
  EXPECT_EQ(Base64::decode("Zm8"), "fo");
}

TEST(UtilsTest, utils_base64_decode_ignores_line_breaks)
{
  EXPECT_EQ(Base64::decode("Zm9v\nYmFy\n"), "foobar");
  EXPECT_EQ(Base64::decode("Zm9v YmFy"), "foobar");
}

TEST(UtilsTest, utils_base64_decode_binary)
{
  std::string binary{"\x00\xff\x10\x80", 4};
  EXPECT_EQ(Base64::decode(Base64::encode(binary)), binary);
}

TEST(UtilsTest, utils_base64_decode_invalid)
{
  EXPECT_THROW(Base64::decode("Zm9v!"), Base64Exception);
  EXPECT_THROW(Base64::decode("Z"), Base64Exception);
  EXPECT_THROW(Base64::decode("Zg=a"), Base64Exception);
  EXPECT_THROW(Base64::decode("Z==="), Base64Exception);
}

TEST(UtilsTest, utils_date_parse_utc)
{
  EXPECT_EQ(DateUtils::parse_time_point("2015-01-01T00:00:00Z"), make_time_point(1420070400));
  EXPECT_EQ(DateUtils::parse_time_point("2015-01-01T12:30:15Z"), make_time_point(1420115415));
  EXPECT_EQ(DateUtils::parse_time_point("2015-01-01T12:30:15"), make_time_point(1420115415));
  EXPECT_EQ(DateUtils::parse_time_point("2015-01-01 12:30:15"), make_time_point(1420115415));
}

TEST(UtilsTest, utils_date_parse_date_only)
{
  EXPECT_EQ(DateUtils::parse_time_point("2015-01-01"), make_time_point(1420070400));
}

TEST(UtilsTest, utils_date_parse_fractional_seconds)
{
  EXPECT_EQ(DateUtils::parse_time_point("2015-01-01T12:30:15.250Z"), make_time_point(1420115415));
}

TEST(UtilsTest, utils_date_parse_offsets)
{
  EXPECT_EQ(DateUtils::parse_time_point("2015-01-01T14:30:15+02:00"), make_time_point(1420115415));
  EXPECT_EQ(DateUtils::parse_time_point("2015-01-01T07:30:15-05:00"), make_time_point(1420115415));
  EXPECT_EQ(DateUtils::parse_time_point("2015-01-01T07:30:15-0500"), make_time_point(1420115415));
}

TEST(UtilsTest, utils_date_parse_rfc1123)
{
  EXPECT_EQ(DateUtils::parse_time_point("Thu, 01 Jan 2015 12:30:15 GMT"), make_time_point(1420115415));
}

TEST(UtilsTest, utils_date_parse_invalid)
{
  EXPECT_THROW(DateUtils::parse_time_point("not a date"), std::runtime_error);
  EXPECT_THROW(DateUtils::parse_time_point(""), std::runtime_error);
  EXPECT_FALSE(DateUtils::try_parse_time_point("2015-13-45T00:00:00Z").has_value());
}

TEST(UtilsTest, utils_date_parse_far_future)
{
  EXPECT_EQ(DateUtils::parse_time_point("9999-12-31T23:59:59Z").time_since_epoch().count(), 253402300799);
  EXPECT_EQ(DateUtils::parse_time_point("2300-01-01T00:00:00Z").time_since_epoch().count(), 10413792000);
  EXPECT_GT(DateUtils::parse_time_point("2300-01-01T00:00:00Z"), DateUtils::parse_time_point("2261-01-01T00:00:00Z"));
}

TEST(UtilsTest, utils_date_from_epoch_milliseconds)
{
  EXPECT_EQ(DateUtils::from_epoch_milliseconds(1420070400000.0), make_time_point(1420070400));
  EXPECT_EQ(DateUtils::from_epoch_milliseconds(1420070400999.0), make_time_point(1420070400));
  EXPECT_EQ(DateUtils::from_epoch_milliseconds(-1500.0), make_time_point(-2));
  EXPECT_EQ(DateUtils::from_epoch_milliseconds(1e13)->time_since_epoch().count(), 10000000000);
  EXPECT_EQ(DateUtils::from_epoch_milliseconds(8.64e15)->time_since_epoch().count(), 8640000000000);
  EXPECT_FALSE(DateUtils::from_epoch_milliseconds(8.64e15 + 1000).has_value());
  EXPECT_FALSE(DateUtils::from_epoch_milliseconds(-1e300).has_value());
  EXPECT_FALSE(DateUtils::from_epoch_milliseconds(std::numeric_limits<double>::infinity()).has_value());
  EXPECT_FALSE(DateUtils::from_epoch_milliseconds(std::numeric_limits<double>::quiet_NaN()).has_value());
}

TEST(UtilsTest, utils_real_time_source)
{
  opencred::utils::RealTimeSource time_source;
  auto before = std::chrono::system_clock::now();
  auto now = time_source.now();
  auto after = std::chrono::system_clock::now();
  EXPECT_LE(before, now);
  EXPECT_LE(now, after);
}
