#include <gtest/gtest.h>
#include <medtrust/audit/audit_sink.hpp>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <memory>
#include <sstream>

using medtrust::audit::audit_event;
using medtrust::audit::audit_event_kind_t;

namespace {

audit_event make_verification_event() {
  auto evidence = medtrust::schema::verification_evidence{};
  evidence.payload_decoded = true;
  evidence.issuer_consistent = true;
  evidence.signature_valid = true;
  evidence.key_status = medtrust::schema::key_status_t::revoked;
  evidence.expiry_check = medtrust::schema::expiry_check_t::within_expiry;
  evidence.anchor_status = medtrust::schema::anchor_status_t::anchored;
  evidence.ledger_reference = "memory:1";
  return audit_event{.timestamp = 42,
                     .kind = audit_event_kind_t::verification,
                     .record_id = "abcd",
                     .outcome = "counterfeit",
                     .evidence = evidence,
                     .detail = std::nullopt};
}

}  // namespace

TEST(audit_sink, formats_evidence_fields) {
  auto line = medtrust::audit::format_event(make_verification_event());
  EXPECT_NE(line.find("kind=verification"), std::string::npos);
  EXPECT_NE(line.find("record=abcd"), std::string::npos);
  EXPECT_NE(line.find("outcome=counterfeit"), std::string::npos);
  EXPECT_NE(line.find("key_status=revoked"), std::string::npos);
  EXPECT_NE(line.find("anchor=anchored"), std::string::npos);
  EXPECT_NE(line.find("ledger_ref=memory:1"), std::string::npos);
}

TEST(audit_sink, flags_interrupted_verification) {
  auto event = make_verification_event();
  EXPECT_EQ(medtrust::audit::format_event(event).find("internal_error"),
            std::string::npos);
  event.evidence->internal_error = true;
  EXPECT_NE(medtrust::audit::format_event(event).find("internal_error=true"),
            std::string::npos);
}

TEST(audit_sink, formats_issuance_detail) {
  auto event = audit_event{.timestamp = 7,
                           .kind = audit_event_kind_t::issuance,
                           .record_id = "",
                           .outcome = "key_revoked",
                           .evidence = std::nullopt,
                           .detail = "issuer key is revoked"};
  auto line = medtrust::audit::format_event(event);
  EXPECT_NE(line.find("kind=issuance"), std::string::npos);
  EXPECT_NE(line.find("detail=\"issuer key is revoked\""), std::string::npos);
  EXPECT_EQ(line.find("signature_valid"), std::string::npos);
}

TEST(audit_sink, memory_sink_keeps_order) {
  auto sink = medtrust::audit::memory_audit_sink{};
  auto first = make_verification_event();
  auto second = make_verification_event();
  second.record_id = "ef01";
  sink.emit(first);
  sink.emit(second);
  auto events = sink.events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].record_id, "abcd");
  EXPECT_EQ(events[1].record_id, "ef01");
}

TEST(audit_sink, log_sink_writes_one_line_per_event) {
  auto stream = std::ostringstream{};
  auto ostream_sink =
      std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
  auto logger = std::make_shared<spdlog::logger>("audit_test", ostream_sink);
  logger->set_pattern("%v");

  auto sink = medtrust::audit::log_audit_sink{logger};
  sink.emit(make_verification_event());
  logger->flush();

  auto text = stream.str();
  EXPECT_NE(text.find("audit kind=verification"), std::string::npos);
  EXPECT_EQ(std::count(std::begin(text), std::end(text), '\n'), 1);
}
