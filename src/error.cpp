#include "nanotimer/error.h"

#include <iostream>

#include "nanotimer/config.h"

namespace nanotimer {

void fatal_error(const std::string& message)
{
  throw std::runtime_error(message);
}

void warning(const std::string& message)
{
  std::cerr << "WARNING: " << message << std::endl;
}

void write_message(int level, const std::string& message)
{
  if (level > NanoTimerConfig::config().verbosity()) return;
  std::cout << message << std::endl;
}

} // namespace nanotimer
