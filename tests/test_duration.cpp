#include "duration_error.hpp"
#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using namespace tparse;
using namespace std::chrono;

namespace {
ParsedDuration negated(const ParsedDuration &value) {
  return value.is_integer() ? ParsedDuration::from_integer(-value.integer())
                            : ParsedDuration::from_real(-value.real());
}

ParsedDuration whole(std::int64_t seconds) {
  return ParsedDuration::from_integer(seconds);
}
} // namespace

TEST_CASE("parse_duration reads clock and word forms") {
  CHECK(parse_duration("1:24") == whole(84));
  CHECK(parse_duration(":22") == whole(22));
  CHECK(parse_duration("1 minute, 24 secs") == whole(84));
  CHECK(parse_duration("1m24s") == whole(84));
  CHECK(parse_duration("1h30m") == whole(5400));
  CHECK(parse_duration("1.5 hours") == whole(5400));
  CHECK(parse_duration("2 weeks, 3 days") == whole(1468800));
  CHECK(parse_duration("10 days 2 hrs") == whole(871200));
  CHECK(parse_duration("1 MINUTE 24 SECS") == whole(84));
  CHECK(parse_duration("  1m24s  ") == whole(84));
  CHECK(parse_duration("-1d2h3m") == whole(-93780));
  CHECK(parse_duration("1:02:03:04") == whole(93784));
}

TEST_CASE("fractional minutes truncate while fractional seconds stay real") {
  auto minutes = parse_duration("1.2 minutes");
  REQUIRE(minutes);
  REQUIRE(minutes->is_integer());
  CHECK(minutes->integer() == 72);

  auto seconds = parse_duration("1.2 seconds");
  REQUIRE(seconds);
  REQUIRE_FALSE(seconds->is_integer());
  CHECK(seconds->real() == 1.2);

  CHECK(parse_duration("1:22:33.5") == ParsedDuration::from_real(4953.5));
  CHECK(parse_duration("5ms") == ParsedDuration::from_real(1e-3 * 5.0));
  CHECK(parse_duration("500ms") == ParsedDuration::from_real(0.5));
  CHECK(parse_duration("-1.5m 30s") == whole(-60));
}

TEST_CASE("minute granularity reads two-field clocks as hours") {
  CHECK(parse_duration("1:14", Granularity::Minutes) == whole(4440));
  CHECK(parse_duration("1:24", Granularity::Minutes) == whole(5040));
  CHECK(parse_duration("1:30", Granularity::Minutes) == whole(5400));
  CHECK(parse_duration(":22", Granularity::Minutes) == whole(22));
  CHECK(parse_duration("1:24.5", Granularity::Minutes) ==
        ParsedDuration::from_real(84.5));
  CHECK(parse_duration("1:02:03", Granularity::Minutes) == whole(3723));
  CHECK(parse_duration("-1:30", Granularity::Minutes) == whole(-5400));
}

TEST_CASE("a leading sign negates the value") {
  const std::vector<std::string> expressions = {
      "1:24",      "1 minute, 24 secs", "1m24s",      "1.2 minutes",
      "1.2 seconds", "1:22:33.5",       "2d 1:00:00", "1:02:03:04",
      ":22",       "3 weeks",           "30",         "3.9"};
  for (const auto &expr : expressions) {
    CAPTURE(expr);
    auto value = parse_duration(expr);
    REQUIRE(value);
    CHECK(parse_duration("-" + expr) == negated(*value));
    CHECK(parse_duration("+" + expr) == *value);
    CHECK(parse_duration("- " + expr) == negated(*value));
  }
}

TEST_CASE("day clocks decompose exactly") {
  char buffer[64];
  for (int a : {0, 1, 5, 123}) {
    for (int b : {0, 7, 23}) {
      for (int c : {0, 30, 59}) {
        for (int d : {0, 9, 59}) {
          std::snprintf(buffer, sizeof(buffer), "%d:%02d:%02d:%02d", a, b, c,
                        d);
          CAPTURE(buffer);
          CHECK(parse_duration(buffer) ==
                whole(a * 86400 + b * 3600 + c * 60 + d));
        }
      }
    }
  }
}

TEST_CASE("numbers pass through truncated") {
  CHECK(parse_duration(42) == whole(42));
  CHECK(parse_duration(-7L) == whole(-7));
  CHECK(parse_duration(std::uint64_t{90}) == whole(90));
  CHECK(parse_duration(std::numeric_limits<std::int64_t>::max()) ==
        whole(std::numeric_limits<std::int64_t>::max()));
  CHECK(parse_duration(static_cast<std::uint64_t>(
            std::numeric_limits<std::int64_t>::max())) ==
        whole(std::numeric_limits<std::int64_t>::max()));
  CHECK_FALSE(parse_duration(std::numeric_limits<std::uint64_t>::max()));
  CHECK_FALSE(parse_duration(static_cast<std::uint64_t>(
                                 std::numeric_limits<std::int64_t>::max()) +
                             1));
  CHECK(parse_duration(42.9) == whole(42));
  CHECK(parse_duration(-42.9) == whole(-42));
  CHECK_FALSE(parse_duration(std::nan("")));
  CHECK_FALSE(parse_duration(1e300));
  CHECK(parse_duration("30") == whole(30));
  CHECK(parse_duration("3.9") == whole(3));
  CHECK(parse_duration("-3.9") == whole(-3));
}

TEST_CASE("formatted integer results parse back to themselves") {
  for (const char *expr :
       {"1:24", "1.2 minutes", "-1d2h3m", "3 weeks", "30", ":22"}) {
    CAPTURE(expr);
    auto value = parse_duration(expr);
    REQUIRE(value);
    REQUIRE(value->is_integer());
    CHECK(parse_duration(to_string(*value)) == value);
  }
}

TEST_CASE("to_string and to_chrono") {
  CHECK(to_string(whole(-93780)) == "-93780");
  CHECK(to_string(ParsedDuration::from_real(4953.5)) == "4953.5");
  CHECK(to_string(ParsedDuration::from_real(1.2)) == "1.2");
  auto value = parse_duration("1m");
  REQUIRE(value);
  CHECK(value->to_chrono() == seconds{60});
  CHECK(value->seconds() == 60.0);
}

TEST_CASE("parse_duration rejects invalid strings") {
  CHECK_FALSE(parse_duration("not a duration"));
  CHECK_FALSE(parse_duration(""));
  CHECK_FALSE(parse_duration("   "));
  CHECK_FALSE(parse_duration("1:2"));
  CHECK_FALSE(parse_duration("1..2 minutes"));
  CHECK_FALSE(parse_duration("1m\n2s"));
  CHECK_FALSE(parse_duration("99999999999999 weeks"));
  CHECK_FALSE(parse_duration(std::string(kMaxExpressionLength + 1, '1')));
}

TEST_CASE("evaluate_duration reports why parsing failed") {
  auto kind_of = [](const std::string &text) {
    try {
      (void)evaluate_duration(text);
    } catch (const DurationError &e) {
      return e.kind();
    }
    FAIL("expected DurationError for " << text);
    return DurationErrorKind::Internal;
  };
  CHECK(kind_of("not a duration") == DurationErrorKind::Malformed);
  CHECK(kind_of(". minutes") == DurationErrorKind::InvalidNumeral);
  CHECK(kind_of("99999999999999 weeks") == DurationErrorKind::Overflow);
  CHECK(evaluate_duration("1:24") == whole(84));
}

TEST_CASE("parse_duration is safe to call concurrently") {
  std::vector<std::thread> threads;
  std::vector<int> ok(4, 0);
  for (std::size_t t = 0; t < ok.size(); ++t) {
    threads.emplace_back([&ok, t] {
      for (int i = 0; i < 50; ++i) {
        if (parse_duration("1 minute, 24 secs") == whole(84) &&
            parse_duration("1:14", Granularity::Minutes) == whole(4440)) {
          ++ok[t];
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  for (int count : ok) {
    CHECK(count == 50);
  }
}
