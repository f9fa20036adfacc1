#include "service_context.hpp"

#include <string>

#include "internal/service/change_feed.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace edgestore::service {

std::int64_t ServiceContext::NowMs() const {
  return now_ms ? now_ms() : util::NowMillis();
}

void ServiceContext::RequireWriter(std::string_view operation) const {
  if (capability != auth::Capability::kWriter) {
    throw util::Unauthorized(std::string(operation) + ": reader capability cannot modify data; use a writer service");
  }
}

void ServiceContext::Announce(const ChangeEvent& event) const {
  if (changes) {
    changes->Publish(event);
  }
}

} // namespace edgestore::service
