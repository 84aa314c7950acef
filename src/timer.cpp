#include "nanotimer/timer.h"

#include <sstream>

#include <fmt/format.h>

#include "nanotimer/config.h"
#include "nanotimer/error.h"

namespace nanotimer {

//==============================================================================
// Segment implementation
//==============================================================================

std::string Segment::name() const
{
  if (label_) return *label_;
  return TIMER_ACTION_TO_STR.at(events_.front().action);
}

Nanoseconds Segment::pause_duration() const
{
  Nanoseconds paused {0};
  // events after the boundary come in pause/resume pairs
  for (size_t i = 1; i + 1 < events_.size(); i += 2) {
    paused += events_[i + 1].timestamp - events_[i].timestamp;
  }
  return paused;
}

//==============================================================================
// Timer implementation
//==============================================================================

Timer::Timer() : Timer("") {}

Timer::Timer(const std::string& name, std::shared_ptr<Clock> clock)
  : name_(name), clock_(std::move(clock))
{
  if (!clock_) clock_ = NanoTimerConfig::config().clock();
}

std::shared_ptr<Timer> Timer::create(const std::string& name, std::shared_ptr<Clock> clock)
{
  return std::make_shared<Timer>(name, std::move(clock));
}

void Timer::open_segment(std::optional<std::string> label,
                         TimerAction action,
                         Nanoseconds timestamp)
{
  segments_.emplace_back(std::move(label), action, timestamp);
  current_ = segments_.size() - 1;
  write_message(7, "timer '{}': {} at {} ns", name_, TIMER_ACTION_TO_STR.at(action), timestamp);
}

void Timer::record_event(TimerAction action, Nanoseconds timestamp)
{
  current_segment().add_event(action, timestamp);
  write_message(7, "timer '{}': {} at {} ns", name_, TIMER_ACTION_TO_STR.at(action), timestamp);
}

Timer& Timer::start(std::optional<std::string> label)
{
  Nanoseconds now = clock_->now();
  if (state_ != TimerState::UNINITIALISED) {
    throw InvalidStateError(fmt::format("timer can only be started if uninitialised (state: {})",
                                        TIMER_STATE_TO_STR.at(state_)));
  }
  segments_.clear();
  open_segment(std::move(label), TimerAction::START, now);
  state_ = TimerState::RUNNING;
  return *this;
}

void Timer::split(std::optional<std::string> label)
{
  Nanoseconds now = clock_->now();
  if (state_ != TimerState::RUNNING && state_ != TimerState::PAUSED) {
    throw InvalidStateError(fmt::format("timer can only be split if running or paused (state: {})",
                                        TIMER_STATE_TO_STR.at(state_)));
  }
  if (state_ == TimerState::PAUSED) {
    record_event(TimerAction::RESUME, now);
    state_ = TimerState::RUNNING;
  }
  open_segment(std::move(label), TimerAction::SPLIT, now);
}

void Timer::pause()
{
  Nanoseconds now = clock_->now();
  if (state_ == TimerState::PAUSED) return;
  if (state_ != TimerState::RUNNING) {
    throw InvalidStateError(fmt::format("timer can only be paused if running or paused (state: {})",
                                        TIMER_STATE_TO_STR.at(state_)));
  }
  record_event(TimerAction::PAUSE, now);
  state_ = TimerState::PAUSED;
}

void Timer::resume()
{
  Nanoseconds now = clock_->now();
  if (state_ == TimerState::RUNNING) return;
  if (state_ != TimerState::PAUSED) {
    throw InvalidStateError(fmt::format("timer can only be resumed if running or paused (state: {})",
                                        TIMER_STATE_TO_STR.at(state_)));
  }
  record_event(TimerAction::RESUME, now);
  state_ = TimerState::RUNNING;
}

Timer& Timer::stop(std::optional<std::string> label)
{
  Nanoseconds now = clock_->now();
  if (state_ != TimerState::RUNNING && state_ != TimerState::PAUSED) {
    throw InvalidStateError(fmt::format("timer can only be stopped if running or paused (state: {})",
                                        TIMER_STATE_TO_STR.at(state_)));
  }
  // close out an open pause at the stop time
  if (state_ == TimerState::PAUSED) {
    record_event(TimerAction::RESUME, now);
  }
  open_segment(std::move(label), TimerAction::STOP, now);
  state_ = TimerState::STOPPED;
  return *this;
}

void Timer::reset()
{
  state_ = TimerState::UNINITIALISED;
  segments_.clear();
  current_ = 0;
  elapsed_.reset();
  split_times_.reset();
  split_periods_.reset();
}

void Timer::require_stopped(const std::string& message) const
{
  if (state_ != TimerState::STOPPED) {
    throw InvalidStateError(fmt::format("{} (state: {})", message, TIMER_STATE_TO_STR.at(state_)));
  }
}

void Timer::check_index(int index, const std::string& what) const
{
  int bound = n_splits();
  if (index < 0 || index >= bound) {
    throw IndexOutOfRangeError(
      fmt::format("{} index {} out of range: 0 <= index < {}", what, index, bound),
      index, bound);
  }
}

int64_t Timer::elapsed_time(TimeUnit unit) const
{
  require_stopped("elapsed time is only available after the timer is stopped");
  if (!elapsed_) {
    Nanoseconds paused {0};
    for (size_t i = 0; i + 1 < segments_.size(); ++i) {
      paused += segments_[i].pause_duration();
    }
    elapsed_ = segments_.back().opened_at() - segments_.front().opened_at() - paused;
  }
  return convert(*elapsed_, unit);
}

const std::vector<int64_t>& Timer::raw_split_times() const
{
  if (!split_times_) {
    std::vector<int64_t> times;
    times.reserve(segments_.size() - 1);
    Nanoseconds start = segments_.front().opened_at();
    Nanoseconds paused {0};
    for (size_t i = 1; i < segments_.size(); ++i) {
      paused += segments_[i - 1].pause_duration();
      times.push_back(segments_[i].opened_at() - start - paused);
    }
    split_times_ = std::move(times);
  }
  return *split_times_;
}

const std::vector<int64_t>& Timer::raw_split_periods() const
{
  if (!split_periods_) {
    std::vector<int64_t> periods;
    periods.reserve(segments_.size() - 1);
    for (size_t i = 1; i < segments_.size(); ++i) {
      const Segment& prev = segments_[i - 1];
      periods.push_back(segments_[i].opened_at() - prev.opened_at() - prev.pause_duration());
    }
    split_periods_ = std::move(periods);
  }
  return *split_periods_;
}

std::vector<int64_t> Timer::split_times(TimeUnit unit) const
{
  require_stopped("split times are only available after the timer is stopped");
  std::vector<int64_t> result;
  for (auto t : raw_split_times()) result.push_back(convert(t, unit));
  return result;
}

int64_t Timer::split_time(int index, TimeUnit unit) const
{
  require_stopped("split times are only available after the timer is stopped");
  check_index(index, "split time");
  return convert(raw_split_times()[index], unit);
}

std::string Timer::split_time_with_name(int index, TimeUnit unit) const
{
  int64_t value = split_time(index, unit);
  return fmt::format("{}[{} {}]", segments_[index].name(), value, TIME_UNIT_TO_STR.at(unit));
}

std::vector<int64_t> Timer::split_periods(TimeUnit unit) const
{
  require_stopped("split periods are only available after the timer is stopped");
  std::vector<int64_t> result;
  for (auto p : raw_split_periods()) result.push_back(convert(p, unit));
  return result;
}

int64_t Timer::split_period(int index, TimeUnit unit) const
{
  require_stopped("split periods are only available after the timer is stopped");
  check_index(index, "split period");
  return convert(raw_split_periods()[index], unit);
}

std::string Timer::split_period_with_name(int index, TimeUnit unit) const
{
  int64_t value = split_period(index, unit);
  return fmt::format("{}[{} {}]", segments_[index].name(), value, TIME_UNIT_TO_STR.at(unit));
}

std::string Timer::to_string(TimeUnit unit) const
{
  if (state_ != TimerState::STOPPED) {
    return "timer " + TIMER_STATE_TO_STR.at(state_);
  }

  std::stringstream ss;
  ss << "{\n";
  ss << fmt::format("  name: \"{}\",\n", name_);
  ss << fmt::format("  elapsed: {} {},\n", elapsed_time(unit), TIME_UNIT_TO_STR.at(unit));
  ss << "  splits: [\n";
  for (size_t i = 0; i < segments_.size(); ++i) {
    const Segment& segment = segments_[i];
    std::string actions;
    for (const auto& event : segment.events()) {
      if (!actions.empty()) actions += ",";
      actions += fmt::format("{}({})", TIMER_ACTION_TO_STR.at(event.action), event.timestamp);
    }
    ss << "    {\n";
    ss << fmt::format("      name: {},\n", segment.name());
    ss << fmt::format("      actions: [{}],\n", actions);
    ss << fmt::format("      paused: {}\n", segment.pause_duration());
    ss << (i + 1 < segments_.size() ? "    },\n" : "    }\n");
  }
  ss << "  ]\n}";
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Timer& timer)
{
  return os << timer.to_string();
}

} // namespace nanotimer
