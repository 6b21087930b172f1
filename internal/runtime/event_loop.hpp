#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "internal/util/time.hpp"

namespace kuberoll::runtime {

/*
  Single-threaded timer loop.

  Every delayed retry and poll tick is a task here; the loop thread is the only
  thread that ever touches rollout state. Tasks due at the same instant run
  in the order they were posted.

  Run() returns when no task is left or Stop() was called; tasks still queued
  after Stop() are dropped.
*/
class EventLoop {
 public:
  using Task = std::function<void()>;

  explicit EventLoop(std::shared_ptr<util::TimeSource> clock);

  EventLoop(const EventLoop&)            = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void Post(Task task);
  void PostDelayed(util::Duration delay, Task task);

  void Run();
  void Stop();

  bool Stopped() const {
    return stopped_;
  }

  std::size_t Pending() const {
    return queue_.size();
  }

  util::TimePoint Now() const;

 private:
  struct Entry {
    util::TimePoint due;
    std::uint64_t   sequence;
    Task            task;
  };

  // Ordering for a min-heap kept with std::push_heap/std::pop_heap.
  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.due != b.due) return a.due > b.due;
      return a.sequence > b.sequence;
    }
  };

  std::shared_ptr<util::TimeSource> clock_;
  std::vector<Entry>                queue_;
  std::uint64_t                     next_sequence_{0};
  bool                              stopped_{false};
};

} // namespace kuberoll::runtime
