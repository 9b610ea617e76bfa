#include "pmm/eventbus/event_bus.hpp"

#include <algorithm>
#include <utility>

namespace pmm {

std::shared_ptr<const EventBus::SubscriberList> EventBus::snapshot() const {
  std::lock_guard lock(mutex_);
  return subscribers_;
}

// -----------------------------------------------------------------------------
// subscribe / unsubscribe: replace the list under the lock
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  auto next = std::make_shared<SubscriberList>(*subscribers_);
  const SubscriptionId id = next_id_++;
  next->push_back(Subscriber{id, std::move(callback)});
  subscribers_ = std::move(next);
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto found = std::find_if(subscribers_->begin(), subscribers_->end(),
                            [id](const Subscriber& s) { return s.id == id; });
  if (found == subscribers_->end()) {
    return;
  }
  auto next = std::make_shared<SubscriberList>();
  next->reserve(subscribers_->size() - 1);
  for (const auto& s : *subscribers_) {
    if (s.id != id) {
      next->push_back(s);
    }
  }
  subscribers_ = std::move(next);
}

// -----------------------------------------------------------------------------
// publish: no lock held while callbacks run
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  const auto current = snapshot();
  for (const auto& s : *current) {
    s.callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  return snapshot()->size();
}

}  // namespace pmm
