#pragma once
#include <medtrust/schema/anchor_record.hpp>
#include <medtrust/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace medtrust::ledger {

using anchor_batch_result_t =
    std::map<medtrust::schema::hash32_t, medtrust::schema::anchor_result_t>;

/// Network details reported by a ledger client.
struct ledger_info final {
  bool available{false};
  std::string network;
  uint64_t anchored_count{};
};

/// Append-only hash anchoring service.
///
/// Implementations report failures as values and never throw. `anchor` is
/// idempotent: a hash that is already anchored yields a receipt for the
/// original anchoring with `previously_anchored` set. `is_anchored`
/// distinguishes "definitively not anchored" (an `anchor_record` with
/// `anchored == false`) from an unreachable ledger (an `anchor_error`).
class anchor_client {
 public:
  virtual ~anchor_client() = default;

  virtual medtrust::schema::anchor_result_t anchor(
      const medtrust::schema::hash32_t& hash) = 0;

  virtual medtrust::schema::anchor_query_result_t is_anchored(
      const medtrust::schema::hash32_t& hash) const = 0;

  /// One ledger round trip for many hashes. Every input hash has an entry in
  /// the result.
  virtual anchor_batch_result_t anchor_batch(
      const std::vector<medtrust::schema::hash32_t>& hashes) = 0;

  virtual ledger_info info() const = 0;
};

}  // namespace medtrust::ledger
