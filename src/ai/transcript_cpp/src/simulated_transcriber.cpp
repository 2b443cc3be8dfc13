#include "transcript_cpp/simulated_transcriber.hpp"

#include <algorithm>
#include <cmath>

#include <drop_common/string_utils.hpp>

using namespace std;


namespace transcript_cpp
{

SimulatedTranscriber::SimulatedTranscriber(const SimulatedTranscriberConfig & config)
: config_(config), phrase_position_(0)
{
}

const vector<string> & SimulatedTranscriber::phrases()
{
  static const vector<string> kPhrases{
    "Hi you've reached Mike Rodriguez",
    "Hello this is Mike",
    "You've reached Mike Rodriguez",
    "Hi you've reached Mike Rodriguez I can't take your call right now",
    "Hello this is Mike I'm not available at the moment",
    "You've reached the voicemail of Mike Rodriguez",
    "Hi you've reached Mike Rodriguez I can't take your call right now please leave your name "
    "and number after the beep",
    "Hello this is Mike I'm not available right now please leave a message after the tone and "
    "I'll get back to you",
    "You've reached Mike Rodriguez I can't come to the phone right now please leave your name "
    "number and a brief message after the beep",
  };
  return kPhrases;
}

optional<string> SimulatedTranscriber::next_fragment(double total_duration, double elapsed_time)
{
  if (last_emit_time_ && elapsed_time - *last_emit_time_ < config_.fragment_interval_sec) {
    return nullopt;
  }
  last_emit_time_ = elapsed_time;

  if (!current_phrase_) {
    const vector<string> & all = phrases();
    const double slot = config_.seconds_per_phrase > 0.0 ?
      floor(max(0.0, total_duration) / config_.seconds_per_phrase) : 0.0;
    const size_t index = min(all.size() - 1, static_cast<size_t>(slot));
    current_phrase_ = all[index];
  }

  const size_t phrase_length = current_phrase_->size();
  const double reveal_window = max(config_.min_reveal_window_sec, total_duration * config_.reveal_window_ratio);
  const double progress = min(1.0, elapsed_time / reveal_window);
  const size_t new_position = static_cast<size_t>(static_cast<double>(phrase_length) * progress);
  if (new_position > phrase_position_) {
    string text = current_phrase_->substr(phrase_position_, new_position - phrase_position_);
    phrase_position_ = new_position;
    return text;
  }

  if (elapsed_time > total_duration * config_.closing_after_ratio) {
    const string lower = drop_common::to_lower(*current_phrase_);
    if (!drop_common::contains(lower, "after the beep") && !drop_common::contains(lower, "message")) {
      return config_.closing_fragment;
    }
  }
  return nullopt;
}

void SimulatedTranscriber::reset()
{
  current_phrase_.reset();
  phrase_position_ = 0;
  last_emit_time_.reset();
}

}  // namespace transcript_cpp
