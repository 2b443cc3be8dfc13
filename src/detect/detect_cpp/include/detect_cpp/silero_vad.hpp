#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "detect_cpp/voice_classifier.hpp"

namespace detect_cpp
{

/// Silero 모델 입력 길이: 추론 창 + 앞 프레임에서 이어받는 context
struct SileroLayout
{
  size_t window = 0;
  size_t context = 0;

  size_t input_size() const
  {
    return window + context;
  }
};

/// 16 kHz -> 512/64, 8 kHz -> 256/32, 그 외 샘플레이트는 모델이 지원하지 않음
std::optional<SileroLayout> silero_layout_for_rate(int sample_rate);

/// out = [context | frame / 32768, 창 길이까지 0 패딩]
/// frame이 비었거나 창보다 길면 false
bool assemble_silero_input(
  const SileroLayout & layout,
  const std::vector<float> & context,
  const std::vector<int16_t> & frame,
  std::vector<float> & out);

/// Silero VAD (ONNX) 기반 VoiceClassifier.
/// 30 ms 프레임은 창 길이에 못 미치므로 0으로 채워 한 번 추론한다.
class SileroVad : public VoiceClassifier
{
public:
  SileroVad();
  ~SileroVad() override;

  SileroVad(const SileroVad &) = delete;
  SileroVad & operator=(const SileroVad &) = delete;

  bool initialize(float threshold, const std::string & model_path);
  bool initialized() const;
  const std::string & last_error() const;

  std::optional<bool> classify(const std::vector<int16_t> & frame, int sample_rate) override;
  void reset() override;
  std::string name() const override;

private:
  struct Session;
  std::unique_ptr<Session> session_;
  float threshold_;
  std::string last_error_;
};

}  // namespace detect_cpp
