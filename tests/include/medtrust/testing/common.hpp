#pragma once

#include <medtrust/common/clock.hpp>
#include <medtrust/schema/calendar_date.hpp>
#include <medtrust/schema/canonical_payload.hpp>
#include <medtrust/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace medtrust::testing {

inline medtrust::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = medtrust::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Start of the UTC day named by `iso_date`.
inline medtrust::schema::timestamp_milliseconds_t at(
    const std::string_view iso_date) {
  return medtrust::schema::start_of_day(
      medtrust::schema::try_parse_iso_date(iso_date).value());
}

inline medtrust::schema::canonical_payload_t make_payload(
    const std::string_view medicine_id = "M1",
    const std::string_view batch_number = "B7",
    const std::string_view manufacture_date = "2024-01-01",
    const std::string_view expiry_date = "2026-01-01",
    const std::string_view issuer_id = "S1",
    const uint64_t sequence = 1) {
  return medtrust::schema::canonical_payload_t{
      .version = medtrust::schema::kCanonicalPayloadVersion,
      .medicine_id = std::string{medicine_id},
      .batch_number = std::string{batch_number},
      .manufacture_date =
          medtrust::schema::try_parse_iso_date(manufacture_date).value(),
      .expiry_date = medtrust::schema::try_parse_iso_date(expiry_date).value(),
      .issuer_id = std::string{issuer_id},
      .sequence = sequence};
}

/// Settable clock shared between a test and the components it drives.
class manual_clock final {
 public:
  explicit manual_clock(const medtrust::schema::timestamp_milliseconds_t now)
      : now_{std::make_shared<std::atomic<uint64_t>>(now)} {}

  void set(const medtrust::schema::timestamp_milliseconds_t now) {
    now_->store(now);
  }

  medtrust::schema::timestamp_milliseconds_t now() const {
    return now_->load();
  }

  medtrust::common::clock_fn_t fn() const {
    return [now = now_] { return now->load(); };
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace medtrust::testing
