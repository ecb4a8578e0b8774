#include "bus/bus.hpp"

#include <algorithm>

namespace coderun {

Bus &Bus::instance() {
  static Bus instance;
  return instance;
}

void Bus::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[type_idx, handlers] : handlers_) {
    handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
                                  [id](const HandlerEntry &entry) {
                                    return entry.id == id;
                                  }),
                   handlers.end());
  }
}

// --- ScopedSubscription ---

ScopedSubscription::~ScopedSubscription() {
  reset();
}

ScopedSubscription::ScopedSubscription(ScopedSubscription &&other) noexcept : id_(other.id_) {
  other.id_ = 0;
}

ScopedSubscription &ScopedSubscription::operator=(ScopedSubscription &&other) noexcept {
  if (this != &other) {
    reset();
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void ScopedSubscription::reset() {
  if (id_ != 0) {
    Bus::instance().unsubscribe(id_);
    id_ = 0;
  }
}

}  // namespace coderun
