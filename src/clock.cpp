#include "nanotimer/clock.h"

namespace nanotimer {

Nanoseconds SteadyClock::now()
{
  auto since_epoch = clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count();
}

} // namespace nanotimer
