#include "greeting_cpp/call_scheduler.hpp"

#include <thread>
#include <utility>

using namespace std;


namespace greeting_cpp
{

CallScheduler::CallScheduler(Clock::duration min_interval, NowFn now_fn, SleepFn sleep_fn)
: min_interval_(min_interval), now_fn_(move(now_fn)), sleep_fn_(move(sleep_fn))
{
  if (!now_fn_) {
    now_fn_ = []() {return Clock::now();};
  }
  if (!sleep_fn_) {
    sleep_fn_ = [](Clock::duration d) {this_thread::sleep_for(d);};
  }
}

optional<CallScheduler::Clock::time_point> CallScheduler::earliest_next() const
{
  if (!last_call_) {
    return nullopt;
  }
  return *last_call_ + min_interval_;
}

CallScheduler::Clock::duration CallScheduler::delay_before_next(Clock::time_point now) const
{
  const auto earliest = earliest_next();
  if (!earliest || now >= *earliest) {
    return Clock::duration::zero();
  }
  return *earliest - now;
}

void CallScheduler::acquire()
{
  const Clock::duration wait = delay_before_next(now_fn_());
  if (wait > Clock::duration::zero()) {
    sleep_fn_(wait);
  }
  record_call(now_fn_());
}

void CallScheduler::record_call(Clock::time_point when)
{
  last_call_ = when;
}

void CallScheduler::reset()
{
  last_call_.reset();
}

}  // namespace greeting_cpp
