#include "nanotimer/report.h"

#include <sstream>

#include <fmt/format.h>

namespace nanotimer {

void write_report(const Timer& timer, TimeUnit unit, std::ostream& os)
{
  const std::string& sym = TIME_UNIT_TO_SYMBOL.at(unit);

  // elapsed_time checks the timer state before anything is written
  int64_t elapsed = timer.elapsed_time(unit);

  os << fmt::format("timer => {}\n\n", timer.to_string());
  os << fmt::format("elapsed   : {}{}\n", elapsed, sym);

  auto times = timer.split_times(unit);
  for (size_t i = 0; i < times.size(); ++i) {
    os << fmt::format("split[{}]  : {}{}\n", i, times[i], sym);
  }

  auto periods = timer.split_periods(unit);
  for (size_t i = 0; i < periods.size(); ++i) {
    os << fmt::format("period[{}] : {}{}\n", i, periods[i], sym);
  }
}

std::string timer_report(const Timer& timer, TimeUnit unit)
{
  std::stringstream ss;
  write_report(timer, unit, ss);
  return ss.str();
}

} // namespace nanotimer
