#pragma once

#include <cstddef>
#include <vector>

namespace detect_cpp
{

struct BandEnergy
{
  double band = 0.0;
  double total = 0.0;

  double ratio() const
  {
    return total > 0.0 ? band / total : 0.0;
  }
};

/// 길이 n의 대칭 Hann window (numpy.hanning과 같음)
std::vector<double> hann_window(size_t n);

/// Hann window를 씌운 신호의 DFT 크기 중 [low_hz, high_hz] 구간(양의 주파수만)
/// 합이 전체 bin 합에서 차지하는 비율.
BandEnergy band_energy(
  const std::vector<float> & samples, int sample_rate, double low_hz, double high_hz);

float peak_amplitude(const std::vector<float> & samples);

}  // namespace detect_cpp
