#ifndef NANOTIMER_TEST_CLOCK_MOCK_H
#define NANOTIMER_TEST_CLOCK_MOCK_H

#include <memory>

#include "nanotimer/clock.h"
#include "nanotimer/constants.h"

using namespace nanotimer;

// Clock that only moves when told to
class ManualClock : public Clock {
public:
  ManualClock(Nanoseconds start = 0) : now_(start) {}

  Nanoseconds now() override {
    ++reads_;
    return now_;
  }

  void set(Nanoseconds t) { now_ = t; }
  void advance(Nanoseconds dt) { now_ += dt; }

  int reads() const { return reads_; }

private:
  Nanoseconds now_;
  int reads_ {0};
};

constexpr Nanoseconds MS {1'000'000};

#endif // NANOTIMER_TEST_CLOCK_MOCK_H
