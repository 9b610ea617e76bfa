#pragma once

#include "pmm/events/event.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace pmm {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for engine observations. The
// OrderManager, PnlTracker and every StrategyLoop publish; the IpcServer,
// the engine's status bookkeeping and tests subscribe.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe and
// publish. Several strategy threads publish at once. Callbacks run
// synchronously on the publishing thread, so subscribers must be quick and
// must tolerate being called from more than one thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked for every published event.
  // Returns the id to pass to unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the published event holds an
  // EventType (e.g. OrderUpdateEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. Unknown ids are ignored. A publish() already in
  // progress on another thread may still invoke the removed callback once.
  void unsubscribe(SubscriptionId id);

  // Delivers the event to every subscriber registered at the time of the
  // call, on the calling thread, before returning.
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  struct Subscriber {
    SubscriptionId id;
    GenericCallback callback;
  };
  using SubscriberList = std::vector<Subscriber>;

  // Copy-on-write: subscribe/unsubscribe install a new list; publish()
  // iterates whichever list was current when it started.
  std::shared_ptr<const SubscriberList> snapshot() const;

  mutable std::mutex mutex_;  // Protects subscribers_ and next_id_
  SubscriptionId next_id_{1};
  std::shared_ptr<const SubscriberList> subscribers_{
      std::make_shared<const SubscriberList>()};
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace pmm
