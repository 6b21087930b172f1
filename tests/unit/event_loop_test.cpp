#include "internal/runtime/event_loop.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <vector>

namespace {

using kuberoll::runtime::EventLoop;
using kuberoll::util::Duration;
using kuberoll::util::ElapsedMillis;
using kuberoll::util::ManualTimeSource;

void TestTasksRunInDueOrder() {
  auto      clock = std::make_shared<ManualTimeSource>();
  EventLoop loop(clock);

  std::vector<int> order;
  loop.PostDelayed(Duration(300), [&] { order.push_back(3); });
  loop.PostDelayed(Duration(100), [&] { order.push_back(1); });
  loop.Post([&] { order.push_back(0); });
  loop.PostDelayed(Duration(100), [&] { order.push_back(2); });

  const auto start = clock->Now();
  loop.Run();

  assert((order == std::vector<int>{0, 1, 2, 3}));
  assert(ElapsedMillis(start, clock->Now()) == 300);
  assert(loop.Pending() == 0);
}

void TestTasksPostedWhileRunningAreScheduledFromNow() {
  auto      clock = std::make_shared<ManualTimeSource>();
  EventLoop loop(clock);

  const auto start = clock->Now();
  int        ticks = 0;

  std::function<void()> tick = [&] {
    ++ticks;
    if (ticks < 5) loop.PostDelayed(Duration(5000), tick);
  };
  loop.Post(tick);
  loop.Run();

  assert(ticks == 5);
  assert(ElapsedMillis(start, clock->Now()) == 20000);
}

void TestSameInstantTasksKeepPostOrder() {
  auto      clock = std::make_shared<ManualTimeSource>();
  EventLoop loop(clock);

  std::vector<int> order;
  for (int i = 0; i < 64; ++i) {
    loop.PostDelayed(Duration(i % 2 == 0 ? 200 : 100), [&order, i] { order.push_back(i); });
  }
  loop.Run();

  std::vector<int> expected;
  for (int i = 1; i < 64; i += 2) expected.push_back(i);
  for (int i = 0; i < 64; i += 2) expected.push_back(i);
  assert(order == expected);
}

void TestTaskIsReleasedOnceRun() {
  auto      clock = std::make_shared<ManualTimeSource>();
  EventLoop loop(clock);

  auto token = std::make_shared<int>(7);
  std::weak_ptr<int> watched = token;
  long               seen    = 0;
  loop.Post([token, &seen] { seen = token.use_count(); });
  token.reset();
  loop.Run();

  // Moved out of the queue, not copied: the task held the only reference.
  assert(seen == 1);
  assert(watched.expired());
}

void TestStopDropsQueuedTasks() {
  auto      clock = std::make_shared<ManualTimeSource>();
  EventLoop loop(clock);

  bool late_ran = false;
  loop.Post([&] { loop.Stop(); });
  loop.PostDelayed(Duration(10), [&] { late_ran = true; });
  loop.Run();

  assert(loop.Stopped());
  assert(!late_ran);
  assert(loop.Pending() == 0);
}

void TestRunWithNothingQueuedReturns() {
  auto      clock = std::make_shared<ManualTimeSource>();
  EventLoop loop(clock);

  loop.Run();
  assert(!loop.Stopped());
}

} // namespace

int main() {
  TestTasksRunInDueOrder();
  TestTasksPostedWhileRunningAreScheduledFromNow();
  TestSameInstantTasksKeepPostOrder();
  TestTaskIsReleasedOnceRun();
  TestStopDropsQueuedTasks();
  TestRunWithNothingQueuedReturns();

  std::cout << "kuberoll_unit_event_loop: pass\n";
  return 0;
}
