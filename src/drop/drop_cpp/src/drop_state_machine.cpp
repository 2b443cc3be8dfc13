#include "drop_cpp/drop_state_machine.hpp"

using namespace std;


namespace drop_cpp
{

string reason_string(DropReason reason)
{
  switch (reason) {
    case DropReason::BEEP_DETECTED:
      return "beep_detected";
    case DropReason::SILENCE_AND_COMPLETE_GREETING:
      return "silence_and_complete_greeting";
    case DropReason::END_OF_SPEECH:
      return "end_of_speech";
    case DropReason::END_OF_AUDIO:
      return "end_of_audio";
    default:
      return "unknown";
  }
}

DropStateMachine::DropStateMachine()
: state_(DropState::IDLE)
{
}

DropState DropStateMachine::state() const
{
  return state_;
}

string DropStateMachine::state_string() const
{
  switch (state_) {
    case DropState::IDLE:
      return "idle";
    case DropState::TRIGGERED:
      return "triggered";
    default:
      return "unknown";
  }
}

bool DropStateMachine::trigger(DropReason reason, double timestamp_sec)
{
  if (state_ == DropState::TRIGGERED) {
    return false;
  }
  DropDecision decision;
  decision.reason = reason;
  decision.timestamp_sec = timestamp_sec;
  decision.triggered = true;
  decision_ = decision;
  state_ = DropState::TRIGGERED;
  return true;
}

const optional<DropDecision> & DropStateMachine::decision() const
{
  return decision_;
}

void DropStateMachine::reset()
{
  state_ = DropState::IDLE;
  decision_.reset();
}

}  // namespace drop_cpp
