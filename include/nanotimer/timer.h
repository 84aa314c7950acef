#ifndef NANOTIMER_TIMER_H
#define NANOTIMER_TIMER_H

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "nanotimer/clock.h"
#include "nanotimer/constants.h"

namespace nanotimer {

//==============================================================================
//! A single action recorded by a timer
//==============================================================================

struct TimerEvent {
  TimerAction action;
  Nanoseconds timestamp;
};

//==============================================================================
//! The span between two consecutive boundary actions (start, split, stop)
//==============================================================================

class Segment {
public:
  Segment(std::optional<std::string> label, TimerAction action, Nanoseconds timestamp)
    : label_(std::move(label)), events_{TimerEvent{action, timestamp}} {}

  //! Label given to the segment, or the name of the action that opened it
  std::string name() const;

  const std::optional<std::string>& label() const { return label_; }

  //! Opening boundary event followed by alternating pause/resume events
  const std::vector<TimerEvent>& events() const { return events_; }

  //! Timestamp of the boundary action that opened this segment
  Nanoseconds opened_at() const { return events_.front().timestamp; }

  //! Total time spent paused within this segment in [ns]
  Nanoseconds pause_duration() const;

private:
  friend class Timer;

  void add_event(TimerAction action, Nanoseconds timestamp) {
    events_.push_back({action, timestamp});
  }

  std::optional<std::string> label_;
  std::vector<TimerEvent> events_;
};

//==============================================================================
//! Nanosecond interval timer supporting start, split, pause, resume and stop
//! actions. Once stopped, the elapsed time, split times and split periods
//! are available in any TimeUnit.
//!
//! A timer is meant to be driven from a single thread.
//==============================================================================

class Timer {
public:
  Timer();

  explicit Timer(const std::string& name, std::shared_ptr<Clock> clock = nullptr);

  //! Create a timer managed by a shared pointer. If no clock is given the
  //! default clock from NanoTimerConfig is used.
  static std::shared_ptr<Timer> create(const std::string& name = "",
                                       std::shared_ptr<Clock> clock = nullptr);

  // Actions

  //! Start the timer. Requires an uninitialised timer.
  Timer& start(std::optional<std::string> label = std::nullopt);

  //! Begin a new split. A paused timer is resumed first.
  void split(std::optional<std::string> label = std::nullopt);

  //! Pause the timer. Pausing a paused timer has no effect.
  void pause();

  //! Resume the timer. Resuming a running timer has no effect.
  void resume();

  //! Stop the timer. A paused timer is resumed at the stop time.
  Timer& stop(std::optional<std::string> label = std::nullopt);

  //! Return the timer to the uninitialised state, discarding all records
  void reset();

  // Accessors
  const std::string& name() const { return name_; }
  TimerState state() const { return state_; }
  const std::vector<Segment>& segments() const { return segments_; }

  // Metrics, available once the timer is stopped

  //! Total time the timer was running, excluding pauses
  int64_t elapsed_time(TimeUnit unit = TimeUnit::NANOSECONDS) const;

  //! Time from the start to each split boundary and to the stop, excluding
  //! pauses up to that boundary
  std::vector<int64_t> split_times(TimeUnit unit = TimeUnit::NANOSECONDS) const;

  int64_t split_time(int index, TimeUnit unit = TimeUnit::NANOSECONDS) const;

  //! Formatted as name[value unit]
  std::string split_time_with_name(int index, TimeUnit unit = TimeUnit::NANOSECONDS) const;

  //! Running time of each segment alone, excluding its pauses
  std::vector<int64_t> split_periods(TimeUnit unit = TimeUnit::NANOSECONDS) const;

  int64_t split_period(int index, TimeUnit unit = TimeUnit::NANOSECONDS) const;

  //! Formatted as name[value unit]
  std::string split_period_with_name(int index, TimeUnit unit = TimeUnit::NANOSECONDS) const;

  //! Number of split times/periods available on a stopped timer
  int n_splits() const { return static_cast<int>(segments_.size()) - 1; }

  //! Describe the timer. A stopped timer lists every segment and its events,
  //! otherwise only the current state is reported.
  std::string to_string(TimeUnit unit = TimeUnit::NANOSECONDS) const;

private:
  void open_segment(std::optional<std::string> label, TimerAction action, Nanoseconds timestamp);
  //! Append a pause/resume event to the open segment
  void record_event(TimerAction action, Nanoseconds timestamp);
  Segment& current_segment() { return segments_[current_]; }

  void require_stopped(const std::string& message) const;
  void check_index(int index, const std::string& what) const;

  const std::vector<int64_t>& raw_split_times() const;
  const std::vector<int64_t>& raw_split_periods() const;

  // Data members
  std::string name_;                     //!< display name of the timer
  std::shared_ptr<Clock> clock_;         //!< timestamp source
  TimerState state_ {TimerState::UNINITIALISED}; //!< current state
  std::vector<Segment> segments_;        //!< ordered segment ledger
  size_t current_ {0};                   //!< index of the open segment

  // cached metrics, cleared on reset
  mutable std::optional<Nanoseconds> elapsed_;
  mutable std::optional<std::vector<int64_t>> split_times_;
  mutable std::optional<std::vector<int64_t>> split_periods_;
};

std::ostream& operator<<(std::ostream& os, const Timer& timer);

} // namespace nanotimer

#endif // NANOTIMER_TIMER_H
