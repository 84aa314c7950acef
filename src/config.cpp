#include "nanotimer/config.h"

#include <algorithm>
#include <mutex>
#include <utility>

#include "nanotimer/error.h"

using namespace nanotimer;

void NanoTimerConfig::set_verbosity(int verbosity) {
  if (verbosity < config::MIN_VERBOSITY || verbosity > config::MAX_VERBOSITY)
    warning("Verbosity must be between {} and {}. Using {}.",
            config::MIN_VERBOSITY, config::MAX_VERBOSITY,
            std::clamp(verbosity, config::MIN_VERBOSITY, config::MAX_VERBOSITY));

  verbosity_ = std::clamp(verbosity, config::MIN_VERBOSITY, config::MAX_VERBOSITY);
}

void NanoTimerConfig::reset() {
  verbosity_ = config::DEFAULT_VERBOSITY;
  default_unit_ = TimeUnit::MICROSECONDS;
  std::lock_guard<std::mutex> lock(clock_mutex_);
  clock_.reset();
}

void NanoTimerConfig::set_clock(std::shared_ptr<Clock> clock) {
  std::lock_guard<std::mutex> lock(clock_mutex_);
  clock_ = std::move(clock);
}

std::shared_ptr<Clock> NanoTimerConfig::clock() {
  std::lock_guard<std::mutex> lock(clock_mutex_);
  if (!clock_) {
    clock_ = std::make_shared<SteadyClock>();
  }
  return clock_;
}
