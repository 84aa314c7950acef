#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "nanotimer/nanotimer.h"

#include "argparse/argparse.hpp"

using namespace nanotimer;

struct Step {
  TimerAction action;
  std::string label;
};

struct Scenario {
  std::string name;
  std::vector<Step> steps;
};

static const std::vector<Scenario> SCENARIOS = {
  {"start - stop",
    {{TimerAction::START, ""}, {TimerAction::STOP, ""}}},
  {"start - split(split1) - stop",
    {{TimerAction::START, ""}, {TimerAction::SPLIT, "split1"}, {TimerAction::STOP, ""}}},
  {"start - pause - resume - stop",
    {{TimerAction::START, ""}, {TimerAction::PAUSE, ""}, {TimerAction::RESUME, ""},
     {TimerAction::STOP, ""}}},
  {"start - pause - stop",
    {{TimerAction::START, ""}, {TimerAction::PAUSE, ""}, {TimerAction::STOP, ""}}},
  {"start - split(split1) - pause - resume - stop",
    {{TimerAction::START, ""}, {TimerAction::SPLIT, "split1"}, {TimerAction::PAUSE, ""},
     {TimerAction::RESUME, ""}, {TimerAction::STOP, ""}}},
  {"start - split(split1) - pause - stop",
    {{TimerAction::START, ""}, {TimerAction::SPLIT, "split1"}, {TimerAction::PAUSE, ""},
     {TimerAction::STOP, ""}}},
  {"start - split(split1) - pause - resume - pause - resume - split(split2) - pause - resume - stop",
    {{TimerAction::START, ""}, {TimerAction::SPLIT, "split1"}, {TimerAction::PAUSE, ""},
     {TimerAction::RESUME, ""}, {TimerAction::PAUSE, ""}, {TimerAction::RESUME, ""},
     {TimerAction::SPLIT, "split2"}, {TimerAction::PAUSE, ""}, {TimerAction::RESUME, ""},
     {TimerAction::STOP, ""}}}
};

void apply(Timer& timer, const Step& step)
{
  std::optional<std::string> label;
  if (!step.label.empty()) label = step.label;

  switch (step.action) {
  case TimerAction::RESET:
    timer.reset();
    break;
  case TimerAction::START:
    timer.start(label);
    break;
  case TimerAction::SPLIT:
    timer.split(label);
    break;
  case TimerAction::PAUSE:
    timer.pause();
    break;
  case TimerAction::RESUME:
    timer.resume();
    break;
  case TimerAction::STOP:
    timer.stop(label);
    break;
  }
}

void run_scenario(int index, int delay_ms, TimeUnit unit)
{
  const Scenario& scenario = SCENARIOS[index];
  auto timer = Timers::create_timer(fmt::format("scenario {}: {}", index + 1, scenario.name));
  timer->reset();

  bool first = true;
  for (const auto& step : scenario.steps) {
    if (!first && delay_ms > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    first = false;
    apply(*timer, step);
  }

  write_report(*timer, unit, std::cout);
  std::cout << "\n" << std::endl;
}

int main(int argc, char** argv) {
  // argument parsing
  argparse::ArgumentParser args("nanotimer scenarios", "1.0", argparse::default_arguments::help);

  args.add_argument("-s", "--scenario")
    .help("Run a single scenario (1-" + std::to_string(SCENARIOS.size()) + ")")
    .default_value(0)
    .scan<'i', int>();

  args.add_argument("-d", "--delay")
    .help("Delay between timer actions in milliseconds (default - 50)")
    .default_value(50)
    .scan<'i', int>();

  args.add_argument("-u", "--unit")
    .help("Time unit for reported values. One of (" + time_unit_names() + ")")
    .default_value(TIME_UNIT_TO_STR.at(NanoTimerConfig::config().default_unit()));

  args.add_argument("-l", "--list")
    .default_value(false)
    .implicit_value(true)
    .help("List the available scenarios and exit");

  args.add_argument("-v", "--verbose")
    .default_value(false)
    .implicit_value(true)
    .help("Print each timer action as it is recorded");

  try {
    args.parse_args(argc, argv);
  }
  catch (const std::runtime_error& err) {
    std::cout << err.what() << std::endl;
    std::cout << args;
    exit(0);
  }

  if (args.get<bool>("--list")) {
    for (size_t i = 0; i < SCENARIOS.size(); ++i) {
      std::cout << i + 1 << ": " << SCENARIOS[i].name << std::endl;
    }
    return 0;
  }

  if (args.get<bool>("--verbose"))
    NanoTimerConfig::config().set_verbosity(7);

  std::string unit_str = args.get<std::string>("--unit");
  if (STR_TO_TIME_UNIT.count(unit_str) == 0)
    fatal_error("Invalid time unit '{}' specified", unit_str);
  TimeUnit unit = STR_TO_TIME_UNIT.at(unit_str);

  int delay = args.get<int>("--delay");
  if (delay < 0)
    fatal_error("Delay must be non-negative, got {}", delay);

  int scenario = args.get<int>("--scenario");
  if (scenario < 0 || scenario > static_cast<int>(SCENARIOS.size()))
    fatal_error("Invalid scenario {} specified", scenario);

  std::cout << "Timers\n------\n" << std::endl;

  if (scenario > 0) {
    run_scenario(scenario - 1, delay, unit);
  } else {
    for (size_t i = 0; i < SCENARIOS.size(); ++i) run_scenario(i, delay, unit);
  }

  return 0;
}
