#include "choice/registry/pending_registrations.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>

namespace choice {

namespace {

struct PendingQueue {
  // Held while applying, so a lookup on another thread waits for the queue
  // to drain. Recursive for lookups made from inside a registration.
  std::recursive_mutex mutex;
  std::deque<std::function<void()>> entries;
};

auto Queue() -> PendingQueue& {
  static PendingQueue queue;
  return queue;
}

}  // namespace

auto QueueRegistration(std::function<void()> apply) -> bool {
  auto& queue = Queue();
  std::lock_guard<std::recursive_mutex> lock(queue.mutex);
  queue.entries.push_back(std::move(apply));
  return true;
}

void ApplyPendingRegistrations() {
  auto& queue = Queue();
  std::lock_guard<std::recursive_mutex> lock(queue.mutex);
  while (!queue.entries.empty()) {
    auto apply = std::move(queue.entries.front());
    queue.entries.pop_front();
    apply();
  }
}

auto PendingRegistrationCount() -> std::size_t {
  auto& queue = Queue();
  std::lock_guard<std::recursive_mutex> lock(queue.mutex);
  return queue.entries.size();
}

}  // namespace choice
