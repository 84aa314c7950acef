#include <memory>
#include <string>
#include <thread>
#include <vector>

// testing includes
#include <catch2/catch_test_macros.hpp>

// nanotimer includes
#include "nanotimer/config.h"
#include "nanotimer/timers.h"

using namespace nanotimer;

TEST_CASE("Create and find timers")
{
  Timers::clear();
  REQUIRE(Timers::size() == 0);
  REQUIRE(Timers::find_timer("missing") == nullptr);

  auto timer = Timers::create_timer("outer loop");
  REQUIRE(timer);
  REQUIRE(timer->name() == "outer loop");
  REQUIRE(timer->state() == TimerState::UNINITIALISED);
  REQUIRE(Timers::find_timer("outer loop") == timer);
  REQUIRE(Timers::size() == 1);

  // the registry hands back the same instance
  timer->start();
  REQUIRE(Timers::find_timer("outer loop")->state() == TimerState::RUNNING);
}

TEST_CASE("Creating a timer with an existing name replaces it")
{
  Timers::clear();
  auto first = Timers::create_timer("dup");
  auto second = Timers::create_timer("dup");
  REQUIRE(first != second);
  REQUIRE(Timers::find_timer("dup") == second);
  REQUIRE(Timers::size() == 1);
}

TEST_CASE("Remove timers")
{
  Timers::clear();
  Timers::create_timer("a");
  Timers::create_timer("b");
  REQUIRE(Timers::size() == 2);

  REQUIRE(Timers::remove_timer("a"));
  REQUIRE_FALSE(Timers::remove_timer("a"));
  REQUIRE(Timers::find_timer("a") == nullptr);
  REQUIRE(Timers::find_timer("b") != nullptr);

  Timers::clear();
  REQUIRE(Timers::size() == 0);
}

TEST_CASE("Timers are kept per thread")
{
  Timers::clear();
  auto main_timer = Timers::create_timer("shared name");

  bool found_in_worker {true};
  bool worker_timer_distinct {false};
  std::thread worker([&]() {
    found_in_worker = Timers::find_timer("shared name") != nullptr;
    auto worker_timer = Timers::create_timer("shared name");
    worker_timer_distinct = worker_timer != main_timer;
  });
  worker.join();

  REQUIRE_FALSE(found_in_worker);
  REQUIRE(worker_timer_distinct);
  REQUIRE(Timers::find_timer("shared name") == main_timer);
}

TEST_CASE("Threads create their first timers concurrently")
{
  // the default clock is created lazily by whichever thread asks first
  NanoTimerConfig::config().reset();

  constexpr int n_threads {8};
  std::vector<int> stopped(n_threads, 0);
  std::vector<std::thread> workers;
  for (int i = 0; i < n_threads; ++i) {
    workers.emplace_back([i, &stopped]() {
      auto timer = Timers::create_timer("worker");
      timer->start().stop();
      stopped[i] = timer->state() == TimerState::STOPPED && timer->elapsed_time() >= 0;
    });
  }
  for (auto& worker : workers) worker.join();

  for (int i = 0; i < n_threads; ++i) {
    REQUIRE(stopped[i] == 1);
  }
  // no worker timer leaks into this thread's registry
  REQUIRE(Timers::find_timer("worker") == nullptr);
  REQUIRE(NanoTimerConfig::config().clock() != nullptr);
}
