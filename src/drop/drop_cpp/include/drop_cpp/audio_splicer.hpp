#pragma once

#include <cstddef>
#include <string>

#include "drop_cpp/audio_buffer.hpp"

namespace drop_cpp
{

struct SpliceResult
{
  bool ok = false;
  std::string output_path;
  size_t original_frames = 0;
  size_t clip_frames = 0;
  size_t output_frames = 0;
  size_t insert_frame = 0;
  std::string error;
};

/// 녹음의 정확한 샘플 위치에 메시지 클립을 삽입한다.
/// 클립을 먼저 녹음의 샘플레이트와 채널 수에 맞추며,
/// 녹음 자체는 바꾸지 않고 나누기만 한다.
class AudioSplicer
{
public:
  AudioSplicer() = default;

  /// 채널별로 클립 전체 길이에 걸쳐 선형 보간.
  /// 출력 길이는 ceil(frames * target_rate / source_rate).
  AudioBuffer resample_linear(const AudioBuffer & clip, int target_rate) const;

  /// mono <-> N 채널은 평균 또는 복제. 그 외 채널 변환은 실패.
  bool match_channels(
    const AudioBuffer & in, int target_channels, AudioBuffer & out, std::string & error) const;

  /// round(drop_time * rate)를 [0, frames]로 제한
  size_t insertion_frame(double drop_time, int sample_rate, size_t frames) const;

  bool insert(
    const AudioBuffer & original, const AudioBuffer & clip, double drop_time,
    AudioBuffer & out, SpliceResult & result) const;

  SpliceResult splice_files(
    const std::string & original_path, const std::string & clip_path,
    double drop_time, const std::string & output_path) const;
};

}  // namespace drop_cpp
