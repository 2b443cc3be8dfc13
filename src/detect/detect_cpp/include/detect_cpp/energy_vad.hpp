#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "detect_cpp/voice_classifier.hpp"

namespace detect_cpp
{

struct EnergyVadConfig
{
  // peak 정규화된 프레임 기준, full scale = 1.0
  float min_rms = 0.08F;
  // 부호가 바뀌는 인접 샘플 쌍의 비율. 광대역 잡음은 0.5 근처
  float max_zero_crossing_rate = 0.35F;
};

/// 모델 없는 classifier: 충분히 크고 잡음 같지 않으면 speech
class EnergyVad : public VoiceClassifier
{
public:
  explicit EnergyVad(const EnergyVadConfig & config = EnergyVadConfig{});

  std::optional<bool> classify(const std::vector<int16_t> & frame, int sample_rate) override;
  std::string name() const override;

  static float rms(const std::vector<int16_t> & frame);
  static float zero_crossing_rate(const std::vector<int16_t> & frame);

private:
  EnergyVadConfig config_;
};

}  // namespace detect_cpp
