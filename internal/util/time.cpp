#include "time.hpp"

#include <thread>

namespace kuberoll::util {

TimePoint SteadyTimeSource::Now() const {
  return Clock::now();
}

void SteadyTimeSource::SleepUntil(TimePoint deadline) {
  std::this_thread::sleep_until(deadline);
}

TimePoint ManualTimeSource::Now() const {
  return now_;
}

void ManualTimeSource::SleepUntil(TimePoint deadline) {
  if (deadline > now_) now_ = deadline;
}

void ManualTimeSource::Advance(Duration delta) {
  now_ += delta;
}

std::int64_t ElapsedMillis(TimePoint from, TimePoint to) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace kuberoll::util
