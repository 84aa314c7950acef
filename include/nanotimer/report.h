#ifndef NANOTIMER_REPORT_H
#define NANOTIMER_REPORT_H

#include <iostream>
#include <string>

#include "nanotimer/constants.h"
#include "nanotimer/timer.h"

namespace nanotimer {

//! Write a summary of a stopped timer: its description followed by the
//! elapsed time, each split time and each split period in the given unit.
//! \param timer Stopped timer to report on
//! \param unit Unit used for all values
//! \param os Output stream
void write_report(const Timer& timer,
                  TimeUnit unit = TimeUnit::MICROSECONDS,
                  std::ostream& os = std::cout);

//! Same as write_report, returned as a string
std::string timer_report(const Timer& timer, TimeUnit unit = TimeUnit::MICROSECONDS);

} // namespace nanotimer

#endif // NANOTIMER_REPORT_H
