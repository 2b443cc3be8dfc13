#include "detect_cpp/silence_detector.hpp"

#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

#include "detect_cpp/spectrum.hpp"

using namespace std;


namespace detect_cpp
{

SilenceDetector::SilenceDetector(
  int sample_rate, shared_ptr<VoiceClassifier> classifier, const SilenceDetectorConfig & config)
: sample_rate_(sample_rate), classifier_(move(classifier)), config_(config)
{
}

/// peak 정규화 후 앞 프레임을 잘라 PCM16으로 바꿔 classifier에 묻는다.
/// classifier가 판단하지 못한 프레임은 non-speech로 센다.
bool SilenceDetector::classify_chunk(const AudioChunk & chunk)
{
  if (!classifier_) {
    return false;
  }
  const size_t frame_size = static_cast<size_t>(
    static_cast<double>(sample_rate_) * config_.frame_duration_sec);
  if (frame_size == 0 || chunk.samples.size() < frame_size) {
    return false;
  }

  const float peak = peak_amplitude(chunk.samples);
  const float gain = peak > 0.0F ? 1.0F / peak : 1.0F;

  vector<int16_t> frame(frame_size);
  for (size_t i = 0; i < frame_size; ++i) {
    frame[i] = static_cast<int16_t>(chunk.samples[i] * gain * 32767.0F);
  }

  const optional<bool> verdict = classifier_->classify(frame, sample_rate_);
  return verdict.value_or(false);
}

double SilenceDetector::process_chunk(const AudioChunk & chunk, double now)
{
  if (chunk.empty()) {
    return state_.silence_duration;
  }

  if (classify_chunk(chunk)) {
    ++state_.consecutive_speech;
    state_.consecutive_silence = 0;
    if (state_.consecutive_speech >= config_.speech_frames_to_activate) {
      state_.speech_active = true;
      state_.last_speech_time = now;
      state_.silence_start.reset();
      state_.silence_duration = 0.0;
    }
  } else {
    ++state_.consecutive_silence;
    state_.consecutive_speech = 0;
    if (state_.consecutive_silence >= config_.silence_frames_to_confirm) {
      if (state_.speech_active) {
        state_.silence_start = now;
        state_.speech_active = false;
      } else if (state_.silence_start) {
        state_.silence_duration = now - *state_.silence_start;
      }
    }
  }
  return state_.silence_duration;
}

void SilenceDetector::reset()
{
  state_ = SilenceDetectorState{};
  if (classifier_) {
    classifier_->reset();
  }
}

const SilenceDetectorState & SilenceDetector::state() const
{
  return state_;
}

double SilenceDetector::last_speech_time() const
{
  return state_.last_speech_time;
}

int SilenceDetector::sample_rate() const
{
  return sample_rate_;
}

}  // namespace detect_cpp
