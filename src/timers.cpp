#include "nanotimer/timers.h"

#include <unordered_map>

#include "nanotimer/error.h"

namespace nanotimer {

namespace {

std::unordered_map<std::string, std::shared_ptr<Timer>>& thread_timers()
{
  thread_local std::unordered_map<std::string, std::shared_ptr<Timer>> timers;
  return timers;
}

} // namespace

std::shared_ptr<Timer> Timers::create_timer(const std::string& name)
{
  auto& timers = thread_timers();
  if (timers.count(name) > 0) {
    warning("Replacing existing timer '{}'", name);
  }
  auto timer = Timer::create(name);
  timers[name] = timer;
  return timer;
}

std::shared_ptr<Timer> Timers::find_timer(const std::string& name)
{
  auto& timers = thread_timers();
  auto it = timers.find(name);
  if (it == timers.end()) return nullptr;
  return it->second;
}

bool Timers::remove_timer(const std::string& name)
{
  return thread_timers().erase(name) > 0;
}

void Timers::clear()
{
  thread_timers().clear();
}

size_t Timers::size()
{
  return thread_timers().size();
}

} // namespace nanotimer
