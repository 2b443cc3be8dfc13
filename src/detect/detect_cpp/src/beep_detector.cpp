#include "detect_cpp/beep_detector.hpp"

#include <algorithm>
#include <numeric>

#include "detect_cpp/spectrum.hpp"

using namespace std;


namespace detect_cpp
{

BeepDetector::BeepDetector(const BeepDetectorConfig & config)
: config_(config)
{
}

bool BeepDetector::process_chunk(const AudioChunk & chunk, double now)
{
  if (chunk.samples.size() < config_.min_samples) {
    return false;
  }

  const BandEnergy energy = band_energy(
    chunk.samples, chunk.sample_rate, config_.band_low_hz, config_.band_high_hz);
  if (energy.total <= 0.0) {
    return false;
  }
  const double ratio = energy.ratio();
  if (ratio <= config_.ratio_threshold || peak_amplitude(chunk.samples) <= config_.min_peak_amplitude) {
    return false;
  }

  state_.recent_ratios.push_back(ratio);
  while (state_.recent_ratios.size() > config_.ratio_history) {
    state_.recent_ratios.pop_front();
  }
  const double avg = accumulate(state_.recent_ratios.begin(), state_.recent_ratios.end(), 0.0) /
    static_cast<double>(state_.recent_ratios.size());
  if (avg <= config_.ratio_threshold) {
    return false;
  }

  // span 이상 떨어진 후보는 더 이상 짝이 될 수 없다
  const double span_limit = config_.max_candidate_span_sec - kStreamTimeEpsilonSec;
  while (!state_.candidate_times.empty() &&
    now - state_.candidate_times.front() >= span_limit)
  {
    state_.candidate_times.pop_front();
  }
  state_.candidate_times.push_back(now);

  if (state_.candidate_times.size() >= config_.min_candidates &&
    state_.candidate_times.back() - state_.candidate_times.front() < span_limit)
  {
    state_.last_detection_time = now;
    state_.confidence = min(1.0, avg);
    state_.candidate_times.clear();
    return true;
  }
  return false;
}

void BeepDetector::reset()
{
  state_ = BeepDetectorState{};
}

const BeepDetectorState & BeepDetector::state() const
{
  return state_;
}

double BeepDetector::confidence() const
{
  return state_.confidence;
}

}  // namespace detect_cpp
