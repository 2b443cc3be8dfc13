#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "greeting_cpp/greeting_oracle.hpp"

namespace greeting_cpp
{

/// 다른 oracle의 성공한 판단을 잠시 기억한다.
/// 키는 trim 후 소문자로 바꾼 텍스트의 앞 100자.
class CachedOracle : public GreetingOracle
{
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  CachedOracle(std::shared_ptr<GreetingOracle> inner, double ttl_sec, NowFn now_fn = nullptr);

  Judgment judge(const std::string & text) override;
  std::string name() const override;

  static std::string cache_key(const std::string & text);
  size_t size() const;

private:
  struct Entry
  {
    Judgment judgment;
    Clock::time_point stored_at;
  };

  std::shared_ptr<GreetingOracle> inner_;
  Clock::duration ttl_;
  NowFn now_fn_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace greeting_cpp
