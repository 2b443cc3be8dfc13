#include "greeting_cpp/cached_oracle.hpp"

#include <drop_common/string_utils.hpp>

#include <utility>

using namespace std;


namespace greeting_cpp
{

CachedOracle::CachedOracle(shared_ptr<GreetingOracle> inner, double ttl_sec, NowFn now_fn)
: inner_(move(inner)),
  ttl_(chrono::duration_cast<Clock::duration>(chrono::duration<double>(ttl_sec))),
  now_fn_(move(now_fn))
{
  if (!now_fn_) {
    now_fn_ = []() {return Clock::now();};
  }
}

string CachedOracle::cache_key(const string & text)
{
  return drop_common::to_lower(drop_common::trim(text)).substr(0, 100);
}

Judgment CachedOracle::judge(const string & text)
{
  if (!inner_) {
    return Judgment::unavailable("no_oracle");
  }

  const string key = cache_key(text);
  const Clock::time_point now = now_fn_();
  const auto it = entries_.find(key);
  if (it != entries_.end()) {
    if (now - it->second.stored_at < ttl_) {
      return it->second.judgment;
    }
    entries_.erase(it);
  }

  Judgment fresh = inner_->judge(text);
  if (fresh.available()) {
    entries_[key] = Entry{fresh, now_fn_()};
  }
  return fresh;
}

string CachedOracle::name() const
{
  return inner_ ? "cached(" + inner_->name() + ")" : "cached";
}

size_t CachedOracle::size() const
{
  return entries_.size();
}

}  // namespace greeting_cpp
