#include <medtrust/schema/calendar_date.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>

namespace medtrust::schema {

namespace {

constexpr auto kMillisecondsPerDay = int64_t{86'400'000};

std::optional<int32_t> parse_digits(const std::string_view text) {
  auto value = int32_t{};
  for (const auto ch : text) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::chrono::year_month_day to_ymd(const calendar_date& date) {
  return std::chrono::year_month_day{std::chrono::year{date.year},
                                     std::chrono::month{date.month},
                                     std::chrono::day{date.day}};
}

}  // namespace

std::optional<calendar_date> try_parse_iso_date(const std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  auto year = parse_digits(text.substr(0, 4));
  auto month = parse_digits(text.substr(5, 2));
  auto day = parse_digits(text.substr(8, 2));
  if (!year || !month || !day) {
    return std::nullopt;
  }
  auto date = calendar_date{.year = *year,
                            .month = static_cast<uint8_t>(*month),
                            .day = static_cast<uint8_t>(*day)};
  if (!is_valid(date)) {
    return std::nullopt;
  }
  return date;
}

std::string to_iso_string(const calendar_date& date) {
  auto out = std::string(10, '0');
  auto year = date.year;
  for (auto i = 3; i >= 0; --i) {
    out[static_cast<size_t>(i)] = static_cast<char>('0' + (year % 10));
    year /= 10;
  }
  out[4] = '-';
  out[5] = static_cast<char>('0' + (date.month / 10));
  out[6] = static_cast<char>('0' + (date.month % 10));
  out[7] = '-';
  out[8] = static_cast<char>('0' + (date.day / 10));
  out[9] = static_cast<char>('0' + (date.day % 10));
  return out;
}

bool is_valid(const calendar_date& date) {
  // Four digit years only; keeps the textual form fixed width.
  if (date.year < 1 || date.year > 9999) {
    return false;
  }
  return to_ymd(date).ok();
}

int64_t days_since_epoch(const calendar_date& date) {
  return std::chrono::sys_days{to_ymd(date)}.time_since_epoch().count();
}

calendar_date date_of(const timestamp_milliseconds_t timestamp) {
  // Instants past the last representable date read as 9999-12-31.
  static const auto kLastDay = static_cast<uint64_t>(
      days_since_epoch(calendar_date{.year = 9999, .month = 12, .day = 31}));
  auto days = static_cast<int64_t>(
      std::min(timestamp / static_cast<uint64_t>(kMillisecondsPerDay),
               kLastDay));
  auto ymd = std::chrono::year_month_day{
      std::chrono::sys_days{std::chrono::days{days}}};
  return calendar_date{
      .year = static_cast<int32_t>(static_cast<int>(ymd.year())),
      .month = static_cast<uint8_t>(static_cast<unsigned>(ymd.month())),
      .day = static_cast<uint8_t>(static_cast<unsigned>(ymd.day()))};
}

bool is_after_day(const timestamp_milliseconds_t timestamp,
                  const calendar_date& date) {
  auto day = days_since_epoch(date);
  if (day < 0) {
    return true;
  }
  return timestamp / static_cast<uint64_t>(kMillisecondsPerDay) >
         static_cast<uint64_t>(day);
}

timestamp_milliseconds_t start_of_day(const calendar_date& date) {
  return static_cast<timestamp_milliseconds_t>(days_since_epoch(date) *
                                               kMillisecondsPerDay);
}

}  // namespace medtrust::schema
