#pragma once

#include <cstddef>
#include <vector>

namespace detect_cpp
{

/// 스트림 시각은 chunk 번호 x chunk 길이의 double 곱이라 반올림 오차가 남는다.
/// 이보다 가까운 두 시각은 같은 시각으로 본다.
constexpr double kStreamTimeEpsilonSec = 1e-6;

/// mono 스트림의 고정 길이 조각 하나
struct AudioChunk
{
  std::vector<float> samples;
  int sample_rate = 0;
  size_t index = 0;

  bool empty() const
  {
    return samples.empty();
  }
};

}  // namespace detect_cpp
