#pragma once

#include <medtrust/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace medtrust::common {

/// Source of "now" for components that stamp state (revocation, audit).
/// Injected so tests can pin time.
using clock_fn_t = std::function<medtrust::schema::timestamp_milliseconds_t()>;

inline medtrust::schema::timestamp_milliseconds_t system_now() {
  return static_cast<medtrust::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

inline clock_fn_t system_clock() {
  return [] { return system_now(); };
}

}  // namespace medtrust::common
