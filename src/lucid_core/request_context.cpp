#include "lucid_core/request_context.hpp"

#include "lucid_core/errors.hpp"

namespace lucid_core {

RequestContext RequestContext::with_timeout(std::chrono::milliseconds timeout) {
  RequestContext context;
  context.deadline_ = Clock::now() + timeout;
  return context;
}

std::chrono::milliseconds RequestContext::remaining() const {
  if (!deadline_) {
    return std::chrono::milliseconds::max();
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool RequestContext::expired() const {
  if (is_cancelled()) {
    return true;
  }
  return deadline_ && Clock::now() >= *deadline_;
}

void RequestContext::check(const std::string& stage) const {
  if (is_cancelled()) {
    throw DeadlineExceededError(stage + ": request cancelled");
  }
  if (deadline_ && Clock::now() >= *deadline_) {
    throw DeadlineExceededError(stage + ": deadline exceeded");
  }
}

}  // namespace lucid_core
