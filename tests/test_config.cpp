#include <memory>

// testing includes
#include <catch2/catch_test_macros.hpp>

// nanotimer includes
#include "nanotimer/config.h"
#include "nanotimer/timer.h"

// nanotimer test includes
#include "clock_mock.h"

TEST_CASE("Config defaults")
{
  nanotimer::NanoTimerConfig::config().reset();
  REQUIRE(nanotimer::NanoTimerConfig::config().verbosity() == nanotimer::config::DEFAULT_VERBOSITY);
  REQUIRE(nanotimer::NanoTimerConfig::config().default_unit() == nanotimer::TimeUnit::MICROSECONDS);

  auto clock = nanotimer::NanoTimerConfig::config().clock();
  REQUIRE(clock != nullptr);
  REQUIRE(std::dynamic_pointer_cast<nanotimer::SteadyClock>(clock) != nullptr);
  // the same default clock is handed out until reset
  REQUIRE(nanotimer::NanoTimerConfig::config().clock() == clock);
}

TEST_CASE("Config set verbosity")
{
  nanotimer::NanoTimerConfig::config().reset();
  nanotimer::NanoTimerConfig::config().set_verbosity(7);
  REQUIRE(nanotimer::NanoTimerConfig::config().verbosity() == 7);

  // out of range values are clamped
  nanotimer::NanoTimerConfig::config().set_verbosity(0);
  REQUIRE(nanotimer::NanoTimerConfig::config().verbosity() == nanotimer::config::MIN_VERBOSITY);
  nanotimer::NanoTimerConfig::config().set_verbosity(42);
  REQUIRE(nanotimer::NanoTimerConfig::config().verbosity() == nanotimer::config::MAX_VERBOSITY);

  nanotimer::NanoTimerConfig::config().reset();
}

TEST_CASE("Config default clock")
{
  nanotimer::NanoTimerConfig::config().reset();
  auto manual = std::make_shared<ManualClock>(1000);
  nanotimer::NanoTimerConfig::config().set_clock(manual);

  // timers created without a clock read the configured one
  nanotimer::Timer timer("configured");
  timer.start();
  manual->set(4000);
  timer.stop();
  REQUIRE(timer.elapsed_time() == 3000);
  REQUIRE(manual->reads() == 2);

  nanotimer::NanoTimerConfig::config().set_clock(nullptr);
  REQUIRE(std::dynamic_pointer_cast<nanotimer::SteadyClock>(nanotimer::NanoTimerConfig::config().clock()) != nullptr);

  nanotimer::NanoTimerConfig::config().reset();
}

TEST_CASE("Steady clock is monotonic")
{
  nanotimer::SteadyClock clock;
  auto t0 = clock.now();
  auto t1 = clock.now();
  REQUIRE(t1 >= t0);
}
