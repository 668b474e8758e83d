#include <medtrust/audit/audit_sink.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace medtrust::audit {

std::string format_event(const audit_event& event) {
  auto line = fmt::format("kind={} ts={} record={} outcome={}",
                          to_string(event.kind), event.timestamp,
                          event.record_id, event.outcome);
  if (event.evidence.has_value()) {
    const auto& evidence = *event.evidence;
    line += fmt::format(
        " decoded={} issuer_consistent={} signature_valid={} key_status={} "
        "registry_reachable={} expiry={}",
        evidence.payload_decoded, evidence.issuer_consistent,
        evidence.signature_valid,
        medtrust::schema::to_string(evidence.key_status),
        evidence.registry_reachable,
        medtrust::schema::to_string(evidence.expiry_check));
    if (evidence.anchor_status.has_value()) {
      line += fmt::format(" anchor={}",
                          medtrust::schema::to_string(*evidence.anchor_status));
    }
    if (evidence.ledger_reference.has_value()) {
      line += fmt::format(" ledger_ref={}", *evidence.ledger_reference);
    }
    if (evidence.decode_failure.has_value()) {
      line += fmt::format(" decode_failure=\"{}\"", *evidence.decode_failure);
    }
    if (evidence.internal_error) {
      line += " internal_error=true";
    }
  }
  if (event.detail.has_value()) {
    line += fmt::format(" detail=\"{}\"", *event.detail);
  }
  return line;
}

log_audit_sink::log_audit_sink(std::shared_ptr<spdlog::logger> logger)
    : logger_{std::move(logger)} {}

void log_audit_sink::emit(const audit_event& event) {
  auto logger = logger_ ? logger_ : spdlog::default_logger();
  logger->info("audit {}", format_event(event));
}

void memory_audit_sink::emit(const audit_event& event) {
  auto lock = std::scoped_lock{mutex_};
  events_.push_back(event);
}

std::vector<audit_event> memory_audit_sink::events() const {
  auto lock = std::scoped_lock{mutex_};
  return events_;
}

}  // namespace medtrust::audit
