#ifndef NANOTIMER_CONFIG_H
#define NANOTIMER_CONFIG_H

#include <memory>
#include <mutex>
#include <utility>

#include "nanotimer/clock.h"
#include "nanotimer/constants.h"
#include "nanotimer/error.h"

namespace nanotimer {

namespace config {

constexpr int DEFAULT_VERBOSITY {5};
constexpr int MIN_VERBOSITY {1};
constexpr int MAX_VERBOSITY {10};

} // namespace config

class NanoTimerConfig {
public:
  // Get the singleton instance
  static NanoTimerConfig& config() {
    static NanoTimerConfig instance;
    return instance;
  }

  // Delete copy constructor and assignment operator
  NanoTimerConfig(const NanoTimerConfig&) = delete;
  NanoTimerConfig& operator=(const NanoTimerConfig&) = delete;

  //! Restore defaults. Verbosity and unit are not synchronized, so call
  //! this before other threads start using timers.
  void reset();

private:
  // Private constructor
  NanoTimerConfig() {};

public:

  int verbosity() const { return verbosity_; }

  void set_verbosity(int verbosity);

  TimeUnit default_unit() const { return default_unit_; }

  void set_default_unit(TimeUnit unit) { default_unit_ = unit; }

  //! Clock given to timers constructed without one. Created on first use.
  //! Safe to call from several threads.
  std::shared_ptr<Clock> clock();

  //! Replace the default clock. Passing nullptr restores a SteadyClock.
  void set_clock(std::shared_ptr<Clock> clock);

private:
  // Data members
  int verbosity_ {config::DEFAULT_VERBOSITY};
  TimeUnit default_unit_ {TimeUnit::MICROSECONDS};
  std::shared_ptr<Clock> clock_ {nullptr};
  std::mutex clock_mutex_; //!< guards clock_
};

} // namespace nanotimer

#endif // NANOTIMER_CONFIG_H
