#pragma once

#include <memory>
#include <optional>

#include "detect_cpp/audio_chunk.hpp"
#include "detect_cpp/voice_classifier.hpp"

namespace detect_cpp
{

struct SilenceDetectorConfig
{
  double frame_duration_sec = 0.03;
  int speech_frames_to_activate = 2;
  int silence_frames_to_confirm = 3;
};

struct SilenceDetectorState
{
  int consecutive_speech = 0;
  int consecutive_silence = 0;
  bool speech_active = false;
  std::optional<double> silence_start;
  double silence_duration = 0.0;
  double last_speech_time = 0.0;
};

/// 발화가 끝난 뒤 스트림이 얼마나 조용했는지 잰다.
/// classifier 출력은 debounce한다: speech 2프레임이면 발화 시작, non-speech
/// 3프레임이면 발화 종료. 발화 구간이 끝나기 전까지 silence_duration은 0.
class SilenceDetector
{
public:
  SilenceDetector(
    int sample_rate,
    std::shared_ptr<VoiceClassifier> classifier,
    const SilenceDetectorConfig & config = SilenceDetectorConfig{});

  /// 현재 침묵 길이(초) 반환
  double process_chunk(const AudioChunk & chunk, double now);
  void reset();

  const SilenceDetectorState & state() const;
  double last_speech_time() const;
  int sample_rate() const;

private:
  bool classify_chunk(const AudioChunk & chunk);

  int sample_rate_;
  std::shared_ptr<VoiceClassifier> classifier_;
  SilenceDetectorConfig config_;
  SilenceDetectorState state_;
};

}  // namespace detect_cpp
