#pragma once

#include <optional>
#include <string>

namespace drop_cpp
{

enum class DropReason
{
  BEEP_DETECTED,
  SILENCE_AND_COMPLETE_GREETING,
  END_OF_SPEECH,
  END_OF_AUDIO
};

std::string reason_string(DropReason reason);

struct DropDecision
{
  DropReason reason = DropReason::END_OF_AUDIO;
  double timestamp_sec = 0.0;
  bool triggered = false;
};

enum class DropState
{
  IDLE,
  TRIGGERED
};

/// 스트림당 한 번 IDLE -> TRIGGERED. 첫 결정이 고정된다
class DropStateMachine
{
public:
  DropStateMachine();

  DropState state() const;
  std::string state_string() const;

  /// 이미 결정이 고정돼 있으면 false
  bool trigger(DropReason reason, double timestamp_sec);
  const std::optional<DropDecision> & decision() const;
  void reset();

private:
  DropState state_;
  std::optional<DropDecision> decision_;
};

}  // namespace drop_cpp
