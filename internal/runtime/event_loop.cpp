#include "event_loop.hpp"

#include <algorithm>
#include <utility>

namespace kuberoll::runtime {

EventLoop::EventLoop(std::shared_ptr<util::TimeSource> clock) : clock_(std::move(clock)) {
}

void EventLoop::Post(Task task) {
  PostDelayed(util::Duration::zero(), std::move(task));
}

void EventLoop::PostDelayed(util::Duration delay, Task task) {
  queue_.push_back(Entry{clock_->Now() + delay, next_sequence_++, std::move(task)});
  std::push_heap(queue_.begin(), queue_.end(), Later{});
}

void EventLoop::Run() {
  while (!stopped_ && !queue_.empty()) {
    std::pop_heap(queue_.begin(), queue_.end(), Later{});
    auto entry = std::move(queue_.back());
    queue_.pop_back();

    if (entry.due > clock_->Now()) {
      clock_->SleepUntil(entry.due);
    }
    entry.task();
  }

  queue_.clear();
}

void EventLoop::Stop() {
  stopped_ = true;
}

util::TimePoint EventLoop::Now() const {
  return clock_->Now();
}

} // namespace kuberoll::runtime
