#include "detect_cpp/energy_vad.hpp"

#include <cmath>

using namespace std;


namespace detect_cpp
{

EnergyVad::EnergyVad(const EnergyVadConfig & config)
: config_(config)
{
}

float EnergyVad::rms(const vector<int16_t> & frame)
{
  if (frame.empty()) {
    return 0.0F;
  }
  double acc = 0.0;
  for (const int16_t s : frame) {
    const double v = static_cast<double>(s) / 32768.0;
    acc += v * v;
  }
  return static_cast<float>(sqrt(acc / static_cast<double>(frame.size())));
}

float EnergyVad::zero_crossing_rate(const vector<int16_t> & frame)
{
  if (frame.size() < 2) {
    return 0.0F;
  }
  size_t crossings = 0;
  for (size_t i = 1; i < frame.size(); ++i) {
    if ((frame[i - 1] >= 0) != (frame[i] >= 0)) {
      ++crossings;
    }
  }
  return static_cast<float>(crossings) / static_cast<float>(frame.size() - 1);
}

optional<bool> EnergyVad::classify(const vector<int16_t> & frame, int sample_rate)
{
  if (frame.empty() || sample_rate <= 0) {
    return nullopt;
  }
  return rms(frame) >= config_.min_rms && zero_crossing_rate(frame) <= config_.max_zero_crossing_rate;
}

string EnergyVad::name() const
{
  return "energy";
}

}  // namespace detect_cpp
