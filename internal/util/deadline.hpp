#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace edgestore::util {

/*
  Caller-supplied timeout for one operation.

  Checked between storage batches and before commit; an expired deadline
  aborts the transaction, so nothing partial is persisted.
*/
class Deadline {
 public:
  using SteadyClock = std::chrono::steady_clock;

  // zero or negative timeout means no deadline
  static Deadline After(std::chrono::milliseconds timeout) {
    Deadline deadline;
    if (timeout.count() > 0) {
      deadline.at_ = SteadyClock::now() + timeout;
    }
    return deadline;
  }

  bool Expired() const {
    return at_.has_value() && SteadyClock::now() >= *at_;
  }

  void Check(std::string_view operation) const {
    if (Expired()) {
      throw TransactionAborted(std::string(operation) + ": deadline exceeded");
    }
  }

 private:
  std::optional<SteadyClock::time_point> at_;
};

} // namespace edgestore::util
