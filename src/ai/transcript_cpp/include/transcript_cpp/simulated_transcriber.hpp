#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "transcript_cpp/transcription_source.hpp"

namespace transcript_cpp
{

struct SimulatedTranscriberConfig
{
  double fragment_interval_sec = 0.4;
  // 오디오 이 초마다 준비된 문구 하나
  double seconds_per_phrase = 5.0;
  double min_reveal_window_sec = 3.0;
  double reveal_window_ratio = 0.7;
  double closing_after_ratio = 0.8;
  std::string closing_fragment = " please leave a message after the beep";
};

/// 스트리밍 STT 서비스 대용. 준비된 인사말 하나를 스트림 앞 70% 동안
/// 조금씩 드러낸다. 녹음이 길수록 긴 인사말을 고른다.
class SimulatedTranscriber : public TranscriptionSource
{
public:
  explicit SimulatedTranscriber(
    const SimulatedTranscriberConfig & config = SimulatedTranscriberConfig{});

  std::optional<std::string> next_fragment(double total_duration, double elapsed_time) override;
  void reset() override;

  static const std::vector<std::string> & phrases();

private:
  SimulatedTranscriberConfig config_;
  std::optional<std::string> current_phrase_;
  size_t phrase_position_;
  std::optional<double> last_emit_time_;
};

}  // namespace transcript_cpp
