#include "detect_cpp/spectrum.hpp"

#include <algorithm>
#include <cmath>

using namespace std;


namespace detect_cpp
{

namespace
{

constexpr double kPi = 3.14159265358979323846;

/// 2*pi*m/n의 cos/sin, m은 [0, n). chunk 크기가 바뀔 때만 다시 만든다.
struct TwiddleTable
{
  size_t n = 0;
  vector<double> cos_vals;
  vector<double> sin_vals;

  void prepare(size_t size)
  {
    if (size == n) {
      return;
    }
    n = size;
    cos_vals.resize(n);
    sin_vals.resize(n);
    for (size_t m = 0; m < n; ++m) {
      const double theta = 2.0 * kPi * static_cast<double>(m) / static_cast<double>(n);
      cos_vals[m] = cos(theta);
      sin_vals[m] = sin(theta);
    }
  }
};

double bin_magnitude(const vector<double> & x, const TwiddleTable & table, size_t k)
{
  const size_t n = x.size();
  double re = 0.0;
  double im = 0.0;
  size_t idx = 0;
  for (size_t j = 0; j < n; ++j) {
    re += x[j] * table.cos_vals[idx];
    im -= x[j] * table.sin_vals[idx];
    idx += k;
    if (idx >= n) {
      idx -= n;
    }
  }
  return sqrt(re * re + im * im);
}

}  // namespace

vector<double> hann_window(size_t n)
{
  vector<double> window(n, 1.0);
  if (n < 2) {
    return window;
  }
  const double denom = static_cast<double>(n - 1);
  for (size_t i = 0; i < n; ++i) {
    window[i] = 0.5 - 0.5 * cos(2.0 * kPi * static_cast<double>(i) / denom);
  }
  return window;
}

BandEnergy band_energy(
  const vector<float> & samples, int sample_rate, double low_hz, double high_hz)
{
  BandEnergy out;
  const size_t n = samples.size();
  if (n == 0 || sample_rate <= 0) {
    return out;
  }

  const vector<double> window = hann_window(n);
  vector<double> x(n);
  for (size_t i = 0; i < n; ++i) {
    x[i] = static_cast<double>(samples[i]) * window[i];
  }

  thread_local TwiddleTable table;
  table.prepare(n);

  // 실수 입력은 |X[n-k]| == |X[k]|라서 0..n/2 bin만 계산하고
  // 대칭인 나머지 절반은 합계에 두 번 센다.
  const size_t half = n / 2;
  const double bin_hz = static_cast<double>(sample_rate) / static_cast<double>(n);
  for (size_t k = 0; k <= half; ++k) {
    const double mag = bin_magnitude(x, table, k);
    const bool self_mirrored = k == 0 || (n % 2 == 0 && k == half);
    out.total += self_mirrored ? mag : 2.0 * mag;

    // 짝수 길이 변환의 Nyquist bin은 음의 주파수
    const bool positive = k > 0 && !(n % 2 == 0 && k == half);
    const double freq = static_cast<double>(k) * bin_hz;
    if (positive && freq >= low_hz && freq <= high_hz) {
      out.band += mag;
    }
  }
  return out;
}

float peak_amplitude(const vector<float> & samples)
{
  float peak = 0.0F;
  for (const float s : samples) {
    peak = max(peak, fabs(s));
  }
  return peak;
}

}  // namespace detect_cpp
