#include <gtest/gtest.h>
#include <medtrust/ledger/storage_ledger.hpp>
#include <medtrust/registry/storage_key_registry.hpp>
#include <medtrust/storage/rocksdb/storage.hpp>
#include <medtrust/encoding/payload_encoder.hpp>
#include <medtrust/testing/common.hpp>
#include <medtrust/testing/issuer_fixture.hpp>
#include <medtrust/verification/engine.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <tuple>
#include <variant>
#include <vector>

namespace {

using encoder_t = medtrust::schema::encoding::scale_encoder_t;

class storage_fixture final {
 public:
  explicit storage_fixture(const std::string_view prefix)
      : path_{medtrust::testing::make_temp_path(prefix)} {
    open();
  }
  ~storage_fixture() {
    store_.reset();
    medtrust::testing::remove_path(path_);
  }

  storage_fixture(const storage_fixture&) = delete;
  storage_fixture& operator=(const storage_fixture&) = delete;

  void reopen() {
    store_.reset();
    open();
  }

  /// Close the database under every holder of the store.
  void close() { store_->database.reset(); }

  std::shared_ptr<medtrust::storage::rocksdb_storage_t> store() {
    return store_;
  }

 private:
  void open() {
    store_ = std::make_shared<medtrust::storage::rocksdb_storage_t>(
        medtrust::storage::make_storage<
            medtrust::storage::rocksdb_storage_tag>(path_));
  }

  std::string path_;
  std::shared_ptr<medtrust::storage::rocksdb_storage_t> store_;
};

medtrust::schema::public_key_t make_key(const uint8_t seed) {
  auto key = medtrust::schema::public_key_t{};
  key.fill(seed);
  key[0] = 0x03;
  return key;
}

}  // namespace

TEST(storage, get_returns_nullopt_for_missing_key) {
  auto fixture = storage_fixture{"medtrust_storage_missing"};
  auto encoder = encoder_t{};
  auto key = medtrust::schema::make_bytes(std::string_view{"missing"});
  EXPECT_FALSE(fixture.store()
                   ->get<uint64_t>(encoder, medtrust::schema::bytes_view_t{key})
                   .has_value());
}

TEST(storage, put_then_get_returns_value) {
  auto fixture = storage_fixture{"medtrust_storage_put"};
  auto encoder = encoder_t{};
  auto key = medtrust::schema::make_bytes(std::string_view{"k"});
  auto value = std::tuple<uint64_t, std::string>{7, "seven"};
  fixture.store()->put(encoder, medtrust::schema::bytes_view_t{key}, value);
  auto loaded =
      fixture.store()->get<std::tuple<uint64_t, std::string>>(
          encoder, medtrust::schema::bytes_view_t{key});
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, value);
}

TEST(storage, list_by_prefix_stops_at_prefix_boundary) {
  auto fixture = storage_fixture{"medtrust_storage_prefix"};
  auto entries = std::vector<medtrust::storage::key_value_entry_t>{
      {medtrust::schema::make_bytes(std::string_view{"A|1"}), {0x01}},
      {medtrust::schema::make_bytes(std::string_view{"A|2"}), {0x02}},
      {medtrust::schema::make_bytes(std::string_view{"B|1"}), {0x03}}};
  fixture.store()->put_batch(entries);
  auto listed = fixture.store()->list_by_prefix(
      medtrust::schema::make_bytes_view(std::string_view{"A|"}));
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[0].second, medtrust::schema::bytes_t{0x01});
  EXPECT_EQ(listed[1].second, medtrust::schema::bytes_t{0x02});
}

TEST(storage_key_registry, survives_reopen) {
  auto fixture = storage_fixture{"medtrust_registry_reopen"};
  auto clock = medtrust::testing::manual_clock{1'000};
  {
    auto registry =
        medtrust::registry::storage_key_registry{fixture.store(), clock.fn()};
    EXPECT_TRUE(registry.register_key("S1", make_key(1)));
    clock.set(2'000);
    EXPECT_TRUE(registry.revoke("S1"));
    EXPECT_TRUE(registry.register_key("S1", make_key(2)));
  }
  fixture.reopen();
  auto registry =
      medtrust::registry::storage_key_registry{fixture.store(), clock.fn()};
  EXPECT_EQ(registry.status_of("S1", make_key(1), 1'500),
            medtrust::schema::key_status_t::active);
  EXPECT_EQ(registry.status_of("S1", make_key(1), 2'000),
            medtrust::schema::key_status_t::revoked);
  EXPECT_EQ(registry.status_of("S1", make_key(2), 2'000),
            medtrust::schema::key_status_t::active);
  EXPECT_EQ(registry.keys_of("S1").size(), 2u);
  EXPECT_FALSE(registry.register_key("S1", make_key(1)));
}

TEST(storage_key_registry, issuer_prefixes_do_not_overlap) {
  auto fixture = storage_fixture{"medtrust_registry_prefix"};
  auto registry = medtrust::registry::storage_key_registry{fixture.store()};
  registry.register_key("S1", make_key(1));
  registry.register_key("S10", make_key(2));
  registry.revoke("S1");
  EXPECT_EQ(registry.keys_of("S1").size(), 1u);
  EXPECT_EQ(registry.status_of("S10", make_key(2), UINT64_MAX),
            medtrust::schema::key_status_t::active);
}

TEST(storage_ledger, anchors_once_and_reports_original_receipt) {
  auto fixture = storage_fixture{"medtrust_ledger_anchor"};
  auto clock = medtrust::testing::manual_clock{10};
  auto ledger = medtrust::ledger::storage_ledger{fixture.store(), "local",
                                                 clock.fn()};
  auto hash = medtrust::testing::make_hash(9);

  auto first = ledger.anchor(hash);
  ASSERT_TRUE(std::holds_alternative<medtrust::schema::anchor_receipt>(first));
  EXPECT_FALSE(
      std::get<medtrust::schema::anchor_receipt>(first).previously_anchored);

  clock.set(20);
  auto second = ledger.anchor(hash);
  ASSERT_TRUE(std::holds_alternative<medtrust::schema::anchor_receipt>(second));
  const auto& receipt = std::get<medtrust::schema::anchor_receipt>(second);
  EXPECT_TRUE(receipt.previously_anchored);
  EXPECT_EQ(receipt.anchored_at, 10u);
  EXPECT_EQ(receipt.ledger_reference,
            std::get<medtrust::schema::anchor_receipt>(first).ledger_reference);

  auto query = ledger.is_anchored(hash);
  ASSERT_TRUE(std::holds_alternative<medtrust::schema::anchor_record>(query));
  EXPECT_TRUE(std::get<medtrust::schema::anchor_record>(query).anchored);
  EXPECT_EQ(ledger.info().anchored_count, 1u);
}

TEST(storage_ledger, unknown_hash_is_definitively_not_anchored) {
  auto fixture = storage_fixture{"medtrust_ledger_absent"};
  auto ledger = medtrust::ledger::storage_ledger{fixture.store(), "local"};
  auto query = ledger.is_anchored(medtrust::testing::make_hash(3));
  ASSERT_TRUE(std::holds_alternative<medtrust::schema::anchor_record>(query));
  EXPECT_FALSE(std::get<medtrust::schema::anchor_record>(query).anchored);
}

TEST(storage, closed_database_reports_unavailable) {
  auto fixture = storage_fixture{"medtrust_storage_closed"};
  fixture.close();
  auto encoder = encoder_t{};
  auto key = medtrust::schema::make_bytes(std::string_view{"k"});
  EXPECT_THROW(fixture.store()->get<uint64_t>(
                   encoder, medtrust::schema::bytes_view_t{key}),
               medtrust::storage::storage_unavailable);
  EXPECT_THROW(fixture.store()->list_by_prefix(
                   medtrust::schema::bytes_view_t{key}),
               medtrust::storage::storage_unavailable);
  EXPECT_THROW(fixture.store()->put_batch({{key, {0x01}}}),
               medtrust::storage::storage_unavailable);
}

TEST(storage_key_registry, outage_reports_registry_unavailable) {
  auto fixture = storage_fixture{"medtrust_registry_outage"};
  auto registry = medtrust::registry::storage_key_registry{fixture.store()};
  ASSERT_TRUE(registry.register_key("S1", make_key(1)));
  fixture.close();

  EXPECT_THROW(registry.status_of("S1", make_key(1), 1'000),
               medtrust::registry::registry_unavailable);
  EXPECT_THROW(registry.keys_of("S1"),
               medtrust::registry::registry_unavailable);
  EXPECT_THROW(registry.revoke("S1"),
               medtrust::registry::registry_unavailable);
  EXPECT_THROW(registry.register_key("S2", make_key(2)),
               medtrust::registry::registry_unavailable);
}

TEST(storage_key_registry, outage_verifies_as_unverified) {
  auto fixture = storage_fixture{"medtrust_registry_outage_verify"};
  auto clock =
      medtrust::testing::manual_clock{medtrust::testing::at("2024-01-01")};
  auto registry = std::make_shared<medtrust::registry::storage_key_registry>(
      fixture.store(), clock.fn());
  auto key = medtrust::testing::issuer_fixture::generate_key();
  ASSERT_TRUE(registry->register_key("S1", key.public_key()));

  auto payload = medtrust::encoding::encode_payload(
      medtrust::testing::make_payload());
  auto signature = key.sign(medtrust::schema::bytes_view_t{payload});
  ASSERT_TRUE(signature.has_value());
  auto record = medtrust::schema::qr_record_t{
      .format_version = medtrust::schema::kQrRecordFormatVersion,
      .payload = payload,
      .signature = *signature,
      .issuer_public_key = key.public_key(),
      .issuer_id = "S1",
      .anchor = std::nullopt};
  auto engine = medtrust::verification::engine{registry, nullptr, clock.fn()};
  auto as_of = medtrust::testing::at("2025-06-01");
  ASSERT_EQ(engine.verify(record, as_of, false).outcome,
            medtrust::schema::verification_outcome_t::verified);

  fixture.close();
  auto result = engine.verify(record, as_of, false);
  EXPECT_EQ(result.outcome,
            medtrust::schema::verification_outcome_t::unverified);
  EXPECT_FALSE(result.evidence.registry_reachable);
  EXPECT_FALSE(result.evidence.internal_error);
  EXPECT_TRUE(result.evidence.signature_valid);
}

TEST(storage_key_registry, reads_do_not_create_rows) {
  auto fixture = storage_fixture{"medtrust_registry_rows"};
  auto registry = medtrust::registry::storage_key_registry{fixture.store()};
  for (auto i = 0; i < 100; ++i) {
    auto issuer = "ghost-" + std::to_string(i);
    EXPECT_EQ(registry.status_of(issuer, make_key(1), 1'000),
              medtrust::schema::key_status_t::unknown);
    EXPECT_TRUE(registry.keys_of(issuer).empty());
  }
  EXPECT_EQ(registry.tracked_issuers(), 0u);

  registry.register_key("S1", make_key(1));
  EXPECT_EQ(registry.tracked_issuers(), 1u);
}

TEST(storage_key_registry, revocation_is_never_observed_to_undo) {
  auto fixture = storage_fixture{"medtrust_registry_concurrent"};
  auto clock = medtrust::testing::manual_clock{1'000};
  auto registry =
      medtrust::registry::storage_key_registry{fixture.store(), clock.fn()};
  ASSERT_TRUE(registry.register_key("S1", make_key(1)));
  ASSERT_TRUE(registry.register_key("S2", make_key(2)));

  auto regressions = std::atomic<int>{0};
  auto readers = std::vector<std::thread>{};
  for (auto i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      auto seen_revoked = false;
      for (auto n = 0; n < 500; ++n) {
        auto status = registry.status_of("S1", make_key(1), 5'000);
        if (status == medtrust::schema::key_status_t::revoked) {
          seen_revoked = true;
        } else if (seen_revoked) {
          ++regressions;
        }
        if (registry.status_of("S2", make_key(2), 5'000) !=
            medtrust::schema::key_status_t::active) {
          ++regressions;
        }
      }
    });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds{5});
  EXPECT_TRUE(registry.revoke("S1"));
  for (auto& reader : readers) {
    reader.join();
  }

  EXPECT_EQ(regressions.load(), 0);
  EXPECT_EQ(registry.status_of("S1", make_key(1), 5'000),
            medtrust::schema::key_status_t::revoked);
  // Once revoke returned, every read observes it.
  EXPECT_FALSE(registry.revoke("S1"));
}

TEST(storage_ledger, outage_reports_ledger_unavailable) {
  auto fixture = storage_fixture{"medtrust_ledger_outage"};
  auto ledger = medtrust::ledger::storage_ledger{fixture.store(), "local"};
  auto hash = medtrust::testing::make_hash(4);
  ASSERT_TRUE(std::holds_alternative<medtrust::schema::anchor_receipt>(
      ledger.anchor(hash)));
  fixture.close();

  auto query = ledger.is_anchored(hash);
  ASSERT_TRUE(std::holds_alternative<medtrust::schema::anchor_error>(query));
  EXPECT_EQ(std::get<medtrust::schema::anchor_error>(query).code,
            medtrust::schema::anchor_error_code::ledger_unavailable);

  auto anchored = ledger.anchor(medtrust::testing::make_hash(5));
  ASSERT_TRUE(std::holds_alternative<medtrust::schema::anchor_error>(anchored));
  EXPECT_TRUE(std::get<medtrust::schema::anchor_error>(anchored).unreachable());
  EXPECT_FALSE(ledger.info().available);
}
