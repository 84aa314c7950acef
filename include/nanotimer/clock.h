#ifndef NANOTIMER_CLOCK_H
#define NANOTIMER_CLOCK_H

#include <chrono>
#include <memory>

#include "nanotimer/constants.h"

namespace nanotimer {

//==============================================================================
//! Source of monotonic timestamps read by timers
//==============================================================================

class Clock {
public:
  virtual ~Clock() = default;

  //! Current timestamp in nanoseconds. Only differences between
  //! timestamps from the same clock are meaningful.
  virtual Nanoseconds now() = 0;
};

//==============================================================================
//! Clock backed by std::chrono::steady_clock
//==============================================================================

class SteadyClock : public Clock {
public:
  using clock = std::chrono::steady_clock;

  Nanoseconds now() override;
};

} // namespace nanotimer

#endif // NANOTIMER_CLOCK_H
