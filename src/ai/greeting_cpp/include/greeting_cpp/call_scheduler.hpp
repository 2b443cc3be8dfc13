#pragma once

#include <chrono>
#include <functional>
#include <optional>

namespace greeting_cpp
{

/// 외부 호출 사이의 고정 최소 간격. 다음 호출이 허용되는 가장 이른 시각을
/// 기록하고 acquire()는 그때까지 대기한다.
class CallScheduler
{
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;
  using SleepFn = std::function<void(Clock::duration)>;

  explicit CallScheduler(
    Clock::duration min_interval,
    NowFn now_fn = nullptr,
    SleepFn sleep_fn = nullptr);

  /// `now`에 호출할 수 있으면 0
  Clock::duration delay_before_next(Clock::time_point now) const;
  std::optional<Clock::time_point> earliest_next() const;

  /// 차례를 기다린 뒤 호출 시각을 기록
  void acquire();
  void record_call(Clock::time_point when);
  void reset();

private:
  Clock::duration min_interval_;
  NowFn now_fn_;
  SleepFn sleep_fn_;
  std::optional<Clock::time_point> last_call_;
};

}  // namespace greeting_cpp
