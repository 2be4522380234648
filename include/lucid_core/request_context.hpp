#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace lucid_core {

/**
 * @brief Deadline and cancellation signal for one caller request.
 *
 * Copies share the cancellation flag, so a handler can hand a copy to the
 * pipeline and still cancel it. A default-constructed context never expires.
 */
class RequestContext {
 public:
  using Clock = std::chrono::steady_clock;

  RequestContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  static RequestContext with_timeout(std::chrono::milliseconds timeout);

  bool has_deadline() const {
    return deadline_.has_value();
  }

  // Time left before the deadline; zero once it passed. Contexts without a
  // deadline report std::chrono::milliseconds::max().
  std::chrono::milliseconds remaining() const;

  void cancel() {
    cancelled_->store(true);
  }

  bool is_cancelled() const {
    return cancelled_->load();
  }

  bool expired() const;

  // Throws DeadlineExceededError naming the stage if the context expired.
  void check(const std::string& stage) const;

 private:
  std::optional<Clock::time_point> deadline_;
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace lucid_core
