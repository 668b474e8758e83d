#include <medtrust/ledger/timed_anchor_client.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace medtrust::ledger {

namespace {

enum class call_status_t { completed, timed_out, rejected };

template <typename Result>
struct deadline_call final {
  call_status_t status{call_status_t::completed};
  std::optional<Result> result;
};

/// Queue `fn` on `pool` and wait up to `timeout` for its result. The promise
/// is shared with the task so an abandoned call can still complete safely;
/// an abandoned call that has not started yet is skipped.
template <typename Result, typename Fn>
deadline_call<Result> run_with_deadline(
    medtrust::common::worker_pool& pool,
    Fn fn,
    const std::chrono::milliseconds timeout) {
  auto promise = std::make_shared<std::promise<Result>>();
  auto abandoned = std::make_shared<std::atomic<bool>>(false);
  auto future = promise->get_future();
  auto submitted =
      pool.try_submit([promise, abandoned, fn = std::move(fn)]() mutable {
        if (abandoned->load()) {
          return;
        }
        try {
          promise->set_value(fn());
        } catch (...) {
          promise->set_exception(std::current_exception());
        }
      });
  if (!submitted) {
    return {.status = call_status_t::rejected};
  }
  if (future.wait_for(timeout) != std::future_status::ready) {
    abandoned->store(true);
    return {.status = call_status_t::timed_out};
  }
  return {.result = future.get()};
}

medtrust::schema::anchor_error make_error(
    const call_status_t status,
    const std::chrono::milliseconds timeout) {
  if (status == call_status_t::rejected) {
    return medtrust::schema::anchor_error{
        .code = medtrust::schema::anchor_error_code::ledger_unavailable,
        .message = "ledger call queue is full"};
  }
  return medtrust::schema::anchor_error{
      .code = medtrust::schema::anchor_error_code::ledger_timeout,
      .message = "ledger call exceeded " + std::to_string(timeout.count()) +
                 "ms"};
}

medtrust::schema::anchor_error make_failure(const std::exception& e) {
  return medtrust::schema::anchor_error{
      .code = medtrust::schema::anchor_error_code::ledger_unavailable,
      .message = std::string{"ledger client failed: "} + e.what()};
}

}  // namespace

timed_anchor_client::timed_anchor_client(std::shared_ptr<anchor_client> inner,
                                         std::chrono::milliseconds timeout,
                                         const std::size_t concurrency,
                                         const std::size_t queue_capacity)
    : inner_{std::move(inner)},
      timeout_{timeout},
      pool_{concurrency, queue_capacity} {}

medtrust::schema::anchor_result_t timed_anchor_client::anchor(
    const medtrust::schema::hash32_t& hash) {
  try {
    auto call = run_with_deadline<medtrust::schema::anchor_result_t>(
        pool_, [inner = inner_, hash] { return inner->anchor(hash); },
        timeout_);
    if (!call.result.has_value()) {
      spdlog::warn("Ledger anchor not completed within {}ms", timeout_.count());
      return make_error(call.status, timeout_);
    }
    return std::move(call.result).value();
  } catch (const std::exception& e) {
    spdlog::error("Ledger anchor failed: {}", e.what());
    return make_failure(e);
  }
}

medtrust::schema::anchor_query_result_t timed_anchor_client::is_anchored(
    const medtrust::schema::hash32_t& hash) const {
  try {
    auto call = run_with_deadline<medtrust::schema::anchor_query_result_t>(
        pool_, [inner = inner_, hash] { return inner->is_anchored(hash); },
        timeout_);
    if (!call.result.has_value()) {
      spdlog::warn("Ledger query not completed within {}ms", timeout_.count());
      return make_error(call.status, timeout_);
    }
    return std::move(call.result).value();
  } catch (const std::exception& e) {
    spdlog::error("Ledger query failed: {}", e.what());
    return make_failure(e);
  }
}

anchor_batch_result_t timed_anchor_client::anchor_batch(
    const std::vector<medtrust::schema::hash32_t>& hashes) {
  auto failed = [&](const medtrust::schema::anchor_error& error) {
    auto results = anchor_batch_result_t{};
    for (const auto& hash : hashes) {
      results.insert_or_assign(hash, error);
    }
    return results;
  };
  try {
    auto call = run_with_deadline<anchor_batch_result_t>(
        pool_, [inner = inner_, hashes] { return inner->anchor_batch(hashes); },
        timeout_);
    if (!call.result.has_value()) {
      spdlog::warn("Ledger batch of {} not completed within {}ms",
                   hashes.size(), timeout_.count());
      return failed(make_error(call.status, timeout_));
    }
    return std::move(call.result).value();
  } catch (const std::exception& e) {
    spdlog::error("Ledger batch of {} failed: {}", hashes.size(), e.what());
    return failed(make_failure(e));
  }
}

ledger_info timed_anchor_client::info() const {
  try {
    auto call = run_with_deadline<ledger_info>(
        pool_, [inner = inner_] { return inner->info(); }, timeout_);
    return call.result.value_or(ledger_info{.available = false});
  } catch (const std::exception& e) {
    spdlog::error("Ledger info failed: {}", e.what());
    return ledger_info{.available = false};
  }
}

}  // namespace medtrust::ledger
