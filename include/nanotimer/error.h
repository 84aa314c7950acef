#ifndef NANOTIMER_ERROR_H
#define NANOTIMER_ERROR_H

#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace nanotimer {

//==============================================================================
// Exceptions raised by timers
//==============================================================================

//! Raised when a timer action or metric is requested in a state that
//! does not permit it. The timer is left unchanged.
class InvalidStateError : public std::logic_error {
public:
  explicit InvalidStateError(const std::string& message)
    : std::logic_error(message) {}
};

//! Raised by index-addressed split queries outside [0, n_splits)
class IndexOutOfRangeError : public std::out_of_range {
public:
  IndexOutOfRangeError(const std::string& message, int index, int bound)
    : std::out_of_range(message), index_(index), bound_(bound) {}

  int index() const { return index_; }
  int bound() const { return bound_; }

private:
  int index_;
  int bound_;
};

//==============================================================================
// Messages
//==============================================================================

//! Report an unrecoverable error. Throws std::runtime_error.
[[noreturn]] void fatal_error(const std::string& message);

template<typename... Params>
[[noreturn]] void fatal_error(const std::string& message, const Params&... fmt_args)
{
  fatal_error(fmt::format(fmt::runtime(message), fmt_args...));
}

void warning(const std::string& message);

template<typename... Params>
void warning(const std::string& message, const Params&... fmt_args)
{
  warning(fmt::format(fmt::runtime(message), fmt_args...));
}

//! Write a message to stdout if level does not exceed the configured verbosity
void write_message(int level, const std::string& message);

template<typename... Params>
void write_message(int level, const std::string& message, const Params&... fmt_args)
{
  write_message(level, fmt::format(fmt::runtime(message), fmt_args...));
}

} // namespace nanotimer

#endif // NANOTIMER_ERROR_H
