#pragma once
#include <medtrust/audit/audit_event.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace medtrust::audit {

class audit_sink {
 public:
  virtual ~audit_sink() = default;
  virtual void emit(const audit_event& event) = 0;
};

/// Writes each event as one structured log line.
class log_audit_sink final : public audit_sink {
 public:
  /// Null `logger` means the spdlog default logger.
  explicit log_audit_sink(std::shared_ptr<spdlog::logger> logger = nullptr);
  void emit(const audit_event& event) override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

/// Keeps events in memory, in emission order.
class memory_audit_sink final : public audit_sink {
 public:
  void emit(const audit_event& event) override;
  std::vector<audit_event> events() const;

 private:
  mutable std::mutex mutex_;
  std::vector<audit_event> events_;
};

/// Single-line rendering used by the log sink and the CLI.
std::string format_event(const audit_event& event);

}  // namespace medtrust::audit
