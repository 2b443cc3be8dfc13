#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace detect_cpp
{

/// 짧은 PCM16 프레임 하나에 대한 speech / non-speech 판정
class VoiceClassifier
{
public:
  virtual ~VoiceClassifier() = default;

  /// 판정할 수 없으면 std::nullopt
  virtual std::optional<bool> classify(const std::vector<int16_t> & frame, int sample_rate) = 0;
  virtual void reset() {}
  virtual std::string name() const = 0;
};

struct VadSelection
{
  // 비어 있으면 energy/zero-crossing classifier
  std::string silero_model_path;
  float silero_threshold = 0.5F;
};

/// 설정된 모델을 불러오지 못하면 error를 채우고 nullptr 반환
std::shared_ptr<VoiceClassifier> make_voice_classifier(
  const VadSelection & selection, std::string & error);

}  // namespace detect_cpp
