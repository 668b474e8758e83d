#include <gtest/gtest.h>
#include <medtrust/encoding/payload_encoder.hpp>
#include <medtrust/testing/issuer_fixture.hpp>

#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using medtrust::schema::anchor_mode_t;
using medtrust::schema::anchor_status_t;
using medtrust::schema::expiry_check_t;
using medtrust::schema::key_status_t;
using medtrust::schema::timestamp_milliseconds_t;
using medtrust::schema::verification_outcome_t;
using medtrust::testing::at;

namespace {

// Registry whose lookups fail with an error the engine does not expect.
class broken_registry final : public medtrust::registry::key_registry {
 public:
  explicit broken_registry(
      std::shared_ptr<medtrust::registry::key_registry> inner)
      : inner_{std::move(inner)} {}

  medtrust::schema::key_status_t status_of(
      const medtrust::schema::issuer_id_t&,
      const medtrust::schema::public_key_t&,
      medtrust::schema::timestamp_milliseconds_t) const override {
    throw std::logic_error{"registry index corrupted"};
  }
  bool revoke(const medtrust::schema::issuer_id_t& issuer_id) override {
    return inner_->revoke(issuer_id);
  }
  bool register_key(const medtrust::schema::issuer_id_t& issuer_id,
                    const medtrust::schema::public_key_t& public_key) override {
    return inner_->register_key(issuer_id, public_key);
  }
  std::vector<medtrust::schema::key_record> keys_of(
      const medtrust::schema::issuer_id_t& issuer_id) const override {
    return inner_->keys_of(issuer_id);
  }

 private:
  std::shared_ptr<medtrust::registry::key_registry> inner_;
};

// Ledger whose lookups throw instead of reporting an error value.
class throwing_ledger final : public medtrust::ledger::anchor_client {
 public:
  medtrust::schema::anchor_result_t anchor(
      const medtrust::schema::hash32_t&) override {
    throw std::runtime_error{"ledger client crashed"};
  }
  medtrust::schema::anchor_query_result_t is_anchored(
      const medtrust::schema::hash32_t&) const override {
    throw std::runtime_error{"ledger client crashed"};
  }
  medtrust::ledger::anchor_batch_result_t anchor_batch(
      const std::vector<medtrust::schema::hash32_t>&) override {
    throw std::runtime_error{"ledger client crashed"};
  }
  medtrust::ledger::ledger_info info() const override { return {}; }
};

}  // namespace

TEST(verification_engine, genuine_record_is_verified) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  auto result = fixture.engine().verify(record, at("2025-06-01"), false);

  EXPECT_EQ(result.outcome, verification_outcome_t::verified);
  EXPECT_TRUE(result.evidence.payload_decoded);
  EXPECT_TRUE(result.evidence.issuer_consistent);
  EXPECT_TRUE(result.evidence.signature_valid);
  EXPECT_EQ(result.evidence.key_status, key_status_t::active);
  EXPECT_EQ(result.evidence.expiry_check, expiry_check_t::within_expiry);
  EXPECT_FALSE(result.evidence.anchor_status.has_value());
  EXPECT_FALSE(result.reduced_confidence());
  ASSERT_TRUE(result.payload.has_value());
  EXPECT_EQ(result.payload->medicine_id, "M1");
  EXPECT_EQ(result.payload->batch_number, "B7");
}

TEST(verification_engine, revocation_applies_immediately) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();

  fixture.clock().set(at("2025-01-01"));
  fixture.registry().revoke("S1");

  auto after = fixture.engine().verify(record, at("2025-06-01"), false);
  EXPECT_EQ(after.outcome, verification_outcome_t::counterfeit);
  EXPECT_EQ(after.evidence.key_status, key_status_t::revoked);
  EXPECT_TRUE(after.evidence.signature_valid);

  // Before the revocation instant the key was still good.
  auto before = fixture.engine().verify(record, at("2024-06-01"), false);
  EXPECT_EQ(before.outcome, verification_outcome_t::verified);
}

TEST(verification_engine, expiry_date_is_inclusive) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();

  auto last_day = at("2026-01-01") + 86'400'000 - 1;
  EXPECT_EQ(fixture.engine().verify(record, last_day, false).outcome,
            verification_outcome_t::verified);

  auto result = fixture.engine().verify(record, at("2026-01-02"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::expired);
  EXPECT_EQ(result.evidence.expiry_check, expiry_check_t::expired);

  EXPECT_EQ(fixture.engine().verify(record, at("2027-01-01"), false).outcome,
            verification_outcome_t::expired);
}

TEST(verification_engine, any_payload_byte_flip_is_counterfeit) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  for (std::size_t i = 0; i < record.payload.size(); ++i) {
    auto tampered = record;
    tampered.payload[i] ^= 0x01;
    auto result = fixture.engine().verify(tampered, at("2025-06-01"), false);
    EXPECT_EQ(result.outcome, verification_outcome_t::counterfeit)
        << "flipped payload byte " << i;
    EXPECT_FALSE(result.evidence.signature_valid);
  }
}

TEST(verification_engine, signature_byte_flip_is_counterfeit) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  auto tampered = record;
  tampered.signature[10] ^= 0x80;
  auto result = fixture.engine().verify(tampered, at("2025-06-01"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::counterfeit);
  EXPECT_TRUE(result.evidence.payload_decoded);
  EXPECT_FALSE(result.evidence.signature_valid);
}

TEST(verification_engine, forged_and_expired_is_counterfeit) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  record.signature[0] ^= 0x01;
  auto result = fixture.engine().verify(record, at("2027-01-01"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::counterfeit);
  EXPECT_EQ(result.evidence.expiry_check, expiry_check_t::expired);
}

TEST(verification_engine, envelope_issuer_must_match_payload) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  record.issuer_id = "S2";
  auto result = fixture.engine().verify(record, at("2025-06-01"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::counterfeit);
  EXPECT_FALSE(result.evidence.issuer_consistent);
  EXPECT_TRUE(result.evidence.signature_valid);
}

TEST(verification_engine, self_signed_record_with_unknown_key_is_unverified) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto stranger = medtrust::testing::issuer_fixture::generate_key();
  auto payload = medtrust::encoding::encode_payload(
      medtrust::testing::make_payload());
  auto signature = stranger.sign(medtrust::schema::bytes_view_t{payload});
  ASSERT_TRUE(signature.has_value());

  auto record = medtrust::schema::qr_record_t{
      .format_version = medtrust::schema::kQrRecordFormatVersion,
      .payload = payload,
      .signature = *signature,
      .issuer_public_key = stranger.public_key(),
      .issuer_id = "S1",
      .anchor = std::nullopt};
  auto result = fixture.engine().verify(record, at("2025-06-01"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::unverified);
  EXPECT_TRUE(result.evidence.signature_valid);
  EXPECT_EQ(result.evidence.key_status, key_status_t::unknown);
}

TEST(verification_engine, unreachable_registry_is_unverified) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  fixture.registry().set_available(false);
  auto result = fixture.engine().verify(record, at("2025-06-01"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::unverified);
  EXPECT_FALSE(result.evidence.registry_reachable);
  EXPECT_TRUE(result.evidence.signature_valid);
  EXPECT_EQ(result.evidence.expiry_check, expiry_check_t::within_expiry);
}

TEST(verification_engine, unreachable_registry_never_hides_forgery) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  record.signature[5] ^= 0x01;
  fixture.registry().set_available(false);
  EXPECT_EQ(fixture.engine().verify(record, at("2025-06-01"), false).outcome,
            verification_outcome_t::counterfeit);
}

TEST(verification_engine, undecodable_payload_is_counterfeit) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  record.payload.push_back(0x00);
  auto result = fixture.engine().verify(record, at("2025-06-01"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::counterfeit);
  EXPECT_FALSE(result.evidence.payload_decoded);
  EXPECT_TRUE(result.evidence.decode_failure.has_value());
  EXPECT_EQ(result.evidence.expiry_check, expiry_check_t::not_evaluated);
}

TEST(verification_engine, missing_anchor_only_reduces_confidence) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  auto result = fixture.engine().verify(record, at("2025-06-01"), true);
  EXPECT_EQ(result.outcome, verification_outcome_t::verified);
  EXPECT_EQ(result.evidence.anchor_status, anchor_status_t::not_anchored);
  EXPECT_TRUE(result.reduced_confidence());
}

TEST(verification_engine, unreachable_ledger_only_reduces_confidence) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  fixture.ledger().set_available(false);
  auto result = fixture.engine().verify(record, at("2025-06-01"), true);
  EXPECT_EQ(result.outcome, verification_outcome_t::verified);
  EXPECT_EQ(result.evidence.anchor_status,
            anchor_status_t::ledger_unavailable);
  EXPECT_TRUE(result.reduced_confidence());
}

TEST(verification_engine, anchored_record_reports_ledger_reference) {
  auto fixture = medtrust::testing::issuer_fixture{anchor_mode_t::synchronous};
  auto record = fixture.issue();
  auto result = fixture.engine().verify(record, at("2025-06-01"), true);
  EXPECT_EQ(result.outcome, verification_outcome_t::verified);
  EXPECT_EQ(result.evidence.anchor_status, anchor_status_t::anchored);
  ASSERT_TRUE(result.evidence.ledger_reference.has_value());
  EXPECT_EQ(*result.evidence.ledger_reference, "memory:1");
  EXPECT_FALSE(result.reduced_confidence());
}

TEST(verification_engine, ledger_never_rescues_a_forgery) {
  auto fixture = medtrust::testing::issuer_fixture{anchor_mode_t::synchronous};
  auto record = fixture.issue();
  record.signature[3] ^= 0x01;
  auto result = fixture.engine().verify(record, at("2025-06-01"), true);
  EXPECT_EQ(result.outcome, verification_outcome_t::counterfeit);
  EXPECT_EQ(result.evidence.anchor_status, anchor_status_t::anchored);
}

TEST(verification_engine, verification_is_read_only) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  auto version = fixture.registry().version_of("S1");
  fixture.engine().verify(record, at("2025-06-01"), true);
  fixture.engine().verify(record, at("2025-06-01"), true);
  EXPECT_EQ(fixture.registry().version_of("S1"), version);
  EXPECT_EQ(fixture.ledger().info().anchored_count, 0u);
}

TEST(verification_engine, classify_orders_checks) {
  auto evidence = medtrust::schema::verification_evidence{};
  evidence.payload_decoded = true;
  evidence.issuer_consistent = true;
  evidence.signature_valid = true;
  evidence.key_status = key_status_t::active;
  evidence.expiry_check = expiry_check_t::expired;
  EXPECT_EQ(medtrust::verification::classify(evidence),
            verification_outcome_t::expired);

  evidence.key_status = key_status_t::revoked;
  EXPECT_EQ(medtrust::verification::classify(evidence),
            verification_outcome_t::counterfeit);

  evidence.key_status = key_status_t::unknown;
  EXPECT_EQ(medtrust::verification::classify(evidence),
            verification_outcome_t::unverified);

  evidence.signature_valid = false;
  EXPECT_EQ(medtrust::verification::classify(evidence),
            verification_outcome_t::counterfeit);
}

TEST(verification_engine, far_future_instants_are_expired) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();

  auto result = fixture.engine().verify(
      record, std::numeric_limits<timestamp_milliseconds_t>::max(), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::expired);
  EXPECT_EQ(result.evidence.expiry_check, expiry_check_t::expired);

  // Somewhere in the year 33658.
  auto distant = timestamp_milliseconds_t{1'000'000'000'000'000};
  EXPECT_EQ(fixture.engine().verify(record, distant, false).outcome,
            verification_outcome_t::expired);
}

TEST(verification_engine, unknown_format_version_is_counterfeit) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  record.format_version = 99;
  auto result = fixture.engine().verify(record, at("2025-06-01"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::counterfeit);
  EXPECT_FALSE(result.evidence.payload_decoded);
  ASSERT_TRUE(result.evidence.decode_failure.has_value());
  EXPECT_NE(result.evidence.decode_failure->find("unsupported_version"),
            std::string::npos);
  // The remaining checks still run.
  EXPECT_TRUE(result.evidence.signature_valid);
  EXPECT_EQ(result.evidence.key_status, key_status_t::active);
}

TEST(verification_engine, internal_failure_keeps_proven_forgery) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  record.signature[7] ^= 0x01;
  auto engine = medtrust::verification::engine{
      std::make_shared<broken_registry>(fixture.registry_ptr()),
      fixture.ledger_ptr(), fixture.clock().fn()};

  auto result = engine.verify(record, at("2025-06-01"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::counterfeit);
  EXPECT_TRUE(result.evidence.internal_error);
  EXPECT_TRUE(result.evidence.payload_decoded);
  EXPECT_FALSE(result.evidence.signature_valid);
  EXPECT_TRUE(result.evidence.registry_reachable);
}

TEST(verification_engine, internal_failure_on_genuine_record_is_unverified) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  auto engine = medtrust::verification::engine{
      std::make_shared<broken_registry>(fixture.registry_ptr()),
      fixture.ledger_ptr(), fixture.clock().fn()};

  auto result = engine.verify(record, at("2025-06-01"), false);
  EXPECT_EQ(result.outcome, verification_outcome_t::unverified);
  EXPECT_TRUE(result.evidence.internal_error);
  EXPECT_TRUE(result.evidence.signature_valid);
  ASSERT_TRUE(result.payload.has_value());
  EXPECT_EQ(result.payload->medicine_id, "M1");
}

TEST(verification_engine, throwing_ledger_never_hides_forgery) {
  auto fixture = medtrust::testing::issuer_fixture{};
  auto record = fixture.issue();
  record.signature[1] ^= 0x01;
  auto engine = medtrust::verification::engine{
      fixture.registry_ptr(), std::make_shared<throwing_ledger>(),
      fixture.clock().fn()};

  auto forged = engine.verify(record, at("2025-06-01"), true);
  EXPECT_EQ(forged.outcome, verification_outcome_t::counterfeit);
  EXPECT_TRUE(forged.evidence.internal_error);
  EXPECT_EQ(forged.evidence.key_status, key_status_t::active);
  EXPECT_EQ(forged.evidence.expiry_check, expiry_check_t::within_expiry);

  auto genuine = engine.verify(fixture.issue(), at("2025-06-01"), true);
  EXPECT_EQ(genuine.outcome, verification_outcome_t::unverified);
  EXPECT_TRUE(genuine.evidence.internal_error);
}

TEST(verification_engine, classify_interrupted_never_verifies) {
  using stage_t = medtrust::verification::engine::stage_t;
  auto evidence = medtrust::schema::verification_evidence{};
  evidence.payload_decoded = true;
  evidence.issuer_consistent = true;
  evidence.signature_valid = true;
  evidence.key_status = key_status_t::active;
  evidence.expiry_check = expiry_check_t::within_expiry;
  EXPECT_EQ(medtrust::verification::classify_interrupted(
                evidence, stage_t::expiry_checked),
            verification_outcome_t::unverified);

  // Defaults of checks that never ran prove nothing.
  auto empty = medtrust::schema::verification_evidence{};
  EXPECT_EQ(medtrust::verification::classify_interrupted(empty,
                                                         stage_t::started),
            verification_outcome_t::unverified);
  EXPECT_EQ(medtrust::verification::classify_interrupted(empty,
                                                         stage_t::decoded),
            verification_outcome_t::counterfeit);

  evidence.key_status = key_status_t::revoked;
  EXPECT_EQ(medtrust::verification::classify_interrupted(
                evidence, stage_t::key_checked),
            verification_outcome_t::counterfeit);
}
