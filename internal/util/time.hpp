#pragma once

#include <chrono>
#include <cstdint>

namespace kuberoll::util {

/*
  Single place to control the clock source.

  Everything that waits (retry delays, poll ticks, the global deadline)
  goes through a TimeSource so tests can run a ten minute rollout instantly.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::milliseconds;

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual TimePoint Now() const = 0;

  // Blocks the calling thread until Now() >= deadline.
  virtual void SleepUntil(TimePoint deadline) = 0;
};

class SteadyTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override;
  void      SleepUntil(TimePoint deadline) override;
};

/*
  Virtual clock: SleepUntil jumps straight to the deadline.
*/
class ManualTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override;
  void      SleepUntil(TimePoint deadline) override;

  void Advance(Duration delta);

 private:
  TimePoint now_{};
};

std::int64_t ElapsedMillis(TimePoint from, TimePoint to);

} // namespace kuberoll::util
