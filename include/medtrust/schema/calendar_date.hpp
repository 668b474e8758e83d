#pragma once

#include <medtrust/schema/primitives.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: calendar date.
// ISO-8601 calendar date (YYYY-MM-DD) in UTC. Manufacture and expiry dates
// are carried as dates, never as instants, so every verifier agrees on them
// regardless of locale or timezone.
namespace medtrust::schema {

struct calendar_date final {
  int32_t year{1970};
  uint8_t month{1};
  uint8_t day{1};

  auto operator<=>(const calendar_date&) const = default;
};

/// Parse strict `YYYY-MM-DD`. Rejects out-of-range months and days that do
/// not exist in the given month (including February 29 outside leap years).
std::optional<calendar_date> try_parse_iso_date(std::string_view text);

/// Format as `YYYY-MM-DD` with zero padding.
std::string to_iso_string(const calendar_date& date);

bool is_valid(const calendar_date& date);

/// Days since 1970-01-01.
int64_t days_since_epoch(const calendar_date& date);

/// UTC calendar date that contains the given instant, clamped to
/// 9999-12-31.
calendar_date date_of(timestamp_milliseconds_t timestamp);

/// True when `timestamp` falls on a UTC day strictly after `date`. Exact for
/// every timestamp, including ones beyond the four digit year range.
bool is_after_day(timestamp_milliseconds_t timestamp,
                  const calendar_date& date);

/// First millisecond (UTC) of the given date.
timestamp_milliseconds_t start_of_day(const calendar_date& date);

}  // namespace medtrust::schema
