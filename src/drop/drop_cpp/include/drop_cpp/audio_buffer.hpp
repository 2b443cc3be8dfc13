#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace drop_cpp
{

/// 디코딩된 오디오, interleaved float 프레임
struct AudioBuffer
{
  std::vector<float> samples;
  int sample_rate = 0;
  int channels = 1;
  // 원본 컨테이너의 libsndfile SF_FORMAT_*, 0 = WAV/PCM16
  int format = 0;

  size_t frames() const
  {
    return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
  }

  double duration_sec() const
  {
    return sample_rate > 0 ? static_cast<double>(frames()) / sample_rate : 0.0;
  }

  /// 전체 채널 평균
  std::vector<float> to_mono() const;
};

struct AudioIoResult
{
  bool ok = false;
  std::string error;
};

AudioIoResult read_audio(const std::string & path, AudioBuffer & out);

/// 상위 디렉터리를 만든다. peak가 1.0을 넘으면 버퍼 전체를 줄인다.
AudioIoResult write_audio(const std::string & path, const AudioBuffer & audio);

/// max |sample| <= 1.0이 되도록 균일하게 줄이고 적용한 gain 반환
float normalize_peak(std::vector<float> & samples);

}  // namespace drop_cpp
