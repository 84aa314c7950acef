#ifndef NANOTIMER_TIMERS_H
#define NANOTIMER_TIMERS_H

#include <memory>
#include <string>

#include "nanotimer/timer.h"

namespace nanotimer {

//==============================================================================
//! Named timers, kept separately for each thread
//==============================================================================

class Timers {
public:
  Timers() = delete;

  //! Create a timer and store it under name for the calling thread. An
  //! existing timer with the same name is replaced.
  static std::shared_ptr<Timer> create_timer(const std::string& name);

  //! Timer stored under name for the calling thread, or nullptr
  static std::shared_ptr<Timer> find_timer(const std::string& name);

  //! Remove the timer stored under name. Returns false if there was none.
  static bool remove_timer(const std::string& name);

  //! Remove all timers of the calling thread
  static void clear();

  //! Number of timers held for the calling thread
  static size_t size();
};

} // namespace nanotimer

#endif // NANOTIMER_TIMERS_H
