#ifndef NANOTIMER_CONSTANTS_H
#define NANOTIMER_CONSTANTS_H

#include <cstdint>
#include <map>
#include <string>

namespace nanotimer {

// Timestamps and durations are carried as signed nanosecond counts
using Nanoseconds = int64_t;

//==============================================================================
// Timer states
//==============================================================================

enum class TimerState {
  UNINITIALISED,
  RUNNING,
  PAUSED,
  STOPPED
};

static const std::map<TimerState, std::string> TIMER_STATE_TO_STR =
{
  {TimerState::UNINITIALISED, "uninitialised"},
  {TimerState::RUNNING, "running"},
  {TimerState::PAUSED, "paused"},
  {TimerState::STOPPED, "stopped"}
};

//==============================================================================
// Timer actions
//==============================================================================

enum class TimerAction {
  RESET,
  START,
  SPLIT,
  PAUSE,
  RESUME,
  STOP
};

static const std::map<TimerAction, std::string> TIMER_ACTION_TO_STR =
{
  {TimerAction::RESET, "reset"},
  {TimerAction::START, "start"},
  {TimerAction::SPLIT, "split"},
  {TimerAction::PAUSE, "pause"},
  {TimerAction::RESUME, "resume"},
  {TimerAction::STOP, "stop"}
};

//==============================================================================
// Time units
//==============================================================================

enum class TimeUnit {
  NANOSECONDS,
  MICROSECONDS,
  MILLISECONDS,
  SECONDS,
  MINUTES,
  HOURS,
  DAYS
};

static const std::map<TimeUnit, std::string> TIME_UNIT_TO_STR =
{
  {TimeUnit::NANOSECONDS, "nanoseconds"},
  {TimeUnit::MICROSECONDS, "microseconds"},
  {TimeUnit::MILLISECONDS, "milliseconds"},
  {TimeUnit::SECONDS, "seconds"},
  {TimeUnit::MINUTES, "minutes"},
  {TimeUnit::HOURS, "hours"},
  {TimeUnit::DAYS, "days"}
};

static const std::map<std::string, TimeUnit> STR_TO_TIME_UNIT =
{
  {"nanoseconds", TimeUnit::NANOSECONDS},
  {"microseconds", TimeUnit::MICROSECONDS},
  {"milliseconds", TimeUnit::MILLISECONDS},
  {"seconds", TimeUnit::SECONDS},
  {"minutes", TimeUnit::MINUTES},
  {"hours", TimeUnit::HOURS},
  {"days", TimeUnit::DAYS}
};

// short symbols used when printing reports
static const std::map<TimeUnit, std::string> TIME_UNIT_TO_SYMBOL =
{
  {TimeUnit::NANOSECONDS, "ns"},
  {TimeUnit::MICROSECONDS, "us"},
  {TimeUnit::MILLISECONDS, "ms"},
  {TimeUnit::SECONDS, "s"},
  {TimeUnit::MINUTES, "min"},
  {TimeUnit::HOURS, "h"},
  {TimeUnit::DAYS, "d"}
};

// number of nanoseconds in one of each unit
static const std::map<TimeUnit, Nanoseconds> TIME_UNIT_TO_NS =
{
  {TimeUnit::NANOSECONDS, 1LL},
  {TimeUnit::MICROSECONDS, 1000LL},
  {TimeUnit::MILLISECONDS, 1000LL * 1000},
  {TimeUnit::SECONDS, 1000LL * 1000 * 1000},
  {TimeUnit::MINUTES, 60LL * 1000 * 1000 * 1000},
  {TimeUnit::HOURS, 60LL * 60 * 1000 * 1000 * 1000},
  {TimeUnit::DAYS, 24LL * 60 * 60 * 1000 * 1000 * 1000}
};

//! Comma separated names of all time units, smallest first
inline std::string time_unit_names()
{
  std::string names;
  for (const auto& [unit, name] : TIME_UNIT_TO_STR) {
    if (!names.empty()) names += ", ";
    names += name;
  }
  return names;
}

//! Convert a nanosecond count to the requested unit. Integer division
//! truncates toward zero.
inline int64_t convert(Nanoseconds ns, TimeUnit unit)
{
  return ns / TIME_UNIT_TO_NS.at(unit);
}

} // namespace nanotimer

#endif // NANOTIMER_CONSTANTS_H
