#include <memory>
#include <sstream>
#include <string>

// testing includes
#include <catch2/catch_test_macros.hpp>

// nanotimer includes
#include "nanotimer/error.h"
#include "nanotimer/report.h"

// nanotimer test includes
#include "clock_mock.h"

using namespace nanotimer;

TEST_CASE("Report on a stopped timer")
{
  auto clock = std::make_shared<ManualClock>();
  Timer timer("report", clock);

  timer.start();
  clock->set(50 * MS);
  timer.split("split1");
  clock->set(100 * MS);
  timer.pause();
  clock->set(150 * MS);
  timer.resume();
  clock->set(200 * MS);
  timer.stop();

  std::string report = timer_report(timer, TimeUnit::MICROSECONDS);

  // the report opens with the timer description
  REQUIRE(report.rfind("timer => {\n  name: \"report\",", 0) == 0);

  const std::string summary =
    "elapsed   : 150000us\n"
    "split[0]  : 50000us\n"
    "split[1]  : 150000us\n"
    "period[0] : 50000us\n"
    "period[1] : 100000us\n";
  REQUIRE(report.size() > summary.size());
  REQUIRE(report.substr(report.size() - summary.size()) == summary);

  std::stringstream ss;
  write_report(timer, TimeUnit::MILLISECONDS, ss);
  REQUIRE(ss.str().find("elapsed   : 150ms\n") != std::string::npos);
  REQUIRE(ss.str().find("period[1] : 100ms\n") != std::string::npos);
}

TEST_CASE("Report requires a stopped timer")
{
  auto clock = std::make_shared<ManualClock>();
  Timer timer("running", clock);
  timer.start();

  std::stringstream ss;
  REQUIRE_THROWS_AS(write_report(timer, TimeUnit::MICROSECONDS, ss), InvalidStateError);
  REQUIRE(ss.str().empty());
}
