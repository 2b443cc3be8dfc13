#pragma once

#include <cstddef>
#include <deque>
#include <optional>

#include "detect_cpp/audio_chunk.hpp"

namespace detect_cpp
{

struct BeepDetectorConfig
{
  size_t min_samples = 1024;
  double band_low_hz = 900.0;
  double band_high_hz = 1100.0;
  double ratio_threshold = 0.08;
  float min_peak_amplitude = 0.1F;
  size_t ratio_history = 5;
  size_t min_candidates = 2;
  double max_candidate_span_sec = 0.3;
};

struct BeepDetectorState
{
  std::deque<double> recent_ratios;
  std::deque<double> candidate_times;
  std::optional<double> last_detection_time;
  double confidence = 0.0;
};

/// 900-1100 Hz "메시지를 남기세요" 신호음 검출기.
/// 대역이 스펙트럼 크기의 ratio_threshold 이상을 차지하고 파형 peak가
/// min_peak_amplitude를 넘는 chunk만 후보가 되며, max_candidate_span_sec 안에
/// 후보가 min_candidates개 모여야 검출로 본다.
class BeepDetector
{
public:
  explicit BeepDetector(const BeepDetectorConfig & config = BeepDetectorConfig{});

  /// `now`는 chunk 끝의 스트림 시각(초)
  bool process_chunk(const AudioChunk & chunk, double now);
  void reset();

  const BeepDetectorState & state() const;
  double confidence() const;

private:
  BeepDetectorConfig config_;
  BeepDetectorState state_;
};

}  // namespace detect_cpp
