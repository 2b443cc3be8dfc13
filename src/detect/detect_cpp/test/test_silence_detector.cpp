#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "detect_cpp/energy_vad.hpp"
#include "detect_cpp/silence_detector.hpp"
#include "detect_cpp/silero_vad.hpp"

using detect_cpp::AudioChunk;
using detect_cpp::SilenceDetector;

namespace
{

/// Replays a fixed verdict sequence; past the end it answers `tail`
class ScriptedClassifier : public detect_cpp::VoiceClassifier
{
public:
  explicit ScriptedClassifier(std::deque<std::optional<bool>> script, std::optional<bool> tail = false)
  : script_(std::move(script)), tail_(tail)
  {
  }

  std::optional<bool> classify(const std::vector<int16_t> & frame, int) override
  {
    ++calls;
    last_frame = frame;
    if (script_.empty()) {
      return tail_;
    }
    const auto v = script_.front();
    script_.pop_front();
    return v;
  }

  void reset() override
  {
    ++resets;
  }

  std::string name() const override
  {
    return "scripted";
  }

  int calls = 0;
  int resets = 0;
  std::vector<int16_t> last_frame;

private:
  std::deque<std::optional<bool>> script_;
  std::optional<bool> tail_;
};

AudioChunk constant_chunk(float value, size_t n = 800, int rate = 8000)
{
  AudioChunk chunk;
  chunk.sample_rate = rate;
  chunk.samples.assign(n, value);
  return chunk;
}

constexpr bool S = true;
constexpr bool N = false;

}  // namespace

TEST(SilenceDetector, SingleSpeechFrameDoesNotActivate)
{
  auto vad = std::make_shared<ScriptedClassifier>(std::deque<std::optional<bool>>{S, N, S, N});
  SilenceDetector detector(8000, vad);
  for (int i = 0; i < 4; ++i) {
    detector.process_chunk(constant_chunk(0.2F), 0.1 * (i + 1));
    EXPECT_FALSE(detector.state().speech_active);
  }
  EXPECT_EQ(detector.last_speech_time(), 0.0);
}

TEST(SilenceDetector, SilenceTimerStartsAfterThreeQuietFrames)
{
  auto vad = std::make_shared<ScriptedClassifier>(std::deque<std::optional<bool>>{S, S, N, N, N, N, N});
  SilenceDetector detector(8000, vad);

  EXPECT_EQ(detector.process_chunk(constant_chunk(0.2F), 0.1), 0.0);
  EXPECT_EQ(detector.process_chunk(constant_chunk(0.2F), 0.2), 0.0);
  EXPECT_TRUE(detector.state().speech_active);
  EXPECT_DOUBLE_EQ(detector.last_speech_time(), 0.2);

  EXPECT_EQ(detector.process_chunk(constant_chunk(0.2F), 0.3), 0.0);
  EXPECT_EQ(detector.process_chunk(constant_chunk(0.2F), 0.4), 0.0);
  EXPECT_TRUE(detector.state().speech_active);

  EXPECT_EQ(detector.process_chunk(constant_chunk(0.2F), 0.5), 0.0);
  EXPECT_FALSE(detector.state().speech_active);
  ASSERT_TRUE(detector.state().silence_start.has_value());
  EXPECT_DOUBLE_EQ(*detector.state().silence_start, 0.5);

  EXPECT_NEAR(detector.process_chunk(constant_chunk(0.2F), 0.6), 0.1, 1e-9);
  EXPECT_NEAR(detector.process_chunk(constant_chunk(0.2F), 0.7), 0.2, 1e-9);
}

TEST(SilenceDetector, DurationIsNonDecreasingWhileInactive)
{
  auto vad = std::make_shared<ScriptedClassifier>(std::deque<std::optional<bool>>{S, S}, false);
  SilenceDetector detector(8000, vad);
  double previous = 0.0;
  for (int i = 0; i < 30; ++i) {
    const double d = detector.process_chunk(constant_chunk(0.2F), 0.1 * (i + 1));
    EXPECT_GE(d, previous);
    if (d > 0.0) {
      EXPECT_FALSE(detector.state().speech_active);
      EXPECT_TRUE(detector.state().silence_start.has_value());
    }
    previous = d;
  }
  EXPECT_GT(previous, 2.0);
}

TEST(SilenceDetector, NoSilenceWithoutPriorSpeech)
{
  auto vad = std::make_shared<ScriptedClassifier>(std::deque<std::optional<bool>>{}, false);
  SilenceDetector detector(8000, vad);
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(detector.process_chunk(constant_chunk(0.0F), 0.1 * (i + 1)), 0.0);
  }
  EXPECT_FALSE(detector.state().silence_start.has_value());
}

TEST(SilenceDetector, SpeechOnsetClearsSilence)
{
  auto vad = std::make_shared<ScriptedClassifier>(
    std::deque<std::optional<bool>>{S, S, N, N, N, N, N, S, S});
  SilenceDetector detector(8000, vad);
  double t = 0.0;
  for (int i = 0; i < 7; ++i) {
    t += 0.1;
    detector.process_chunk(constant_chunk(0.2F), t);
  }
  EXPECT_GT(detector.state().silence_duration, 0.0);
  detector.process_chunk(constant_chunk(0.2F), t + 0.1);
  EXPECT_GT(detector.state().silence_duration, 0.0);
  detector.process_chunk(constant_chunk(0.2F), t + 0.2);
  EXPECT_EQ(detector.state().silence_duration, 0.0);
  EXPECT_FALSE(detector.state().silence_start.has_value());
  EXPECT_TRUE(detector.state().speech_active);
}

TEST(SilenceDetector, ClassifierFailureCountsAsNonSpeech)
{
  auto vad = std::make_shared<ScriptedClassifier>(
    std::deque<std::optional<bool>>{S, S, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
  SilenceDetector detector(8000, vad);
  for (int i = 0; i < 6; ++i) {
    detector.process_chunk(constant_chunk(0.2F), 0.1 * (i + 1));
  }
  EXPECT_FALSE(detector.state().speech_active);
  EXPECT_NEAR(detector.state().silence_duration, 0.1, 1e-9);
}

TEST(SilenceDetector, ChunkShorterThanFrameSkipsClassifier)
{
  auto vad = std::make_shared<ScriptedClassifier>(std::deque<std::optional<bool>>{}, true);
  SilenceDetector detector(8000, vad);
  // 30 ms at 8 kHz is 240 samples
  detector.process_chunk(constant_chunk(0.2F, 239), 0.1);
  EXPECT_EQ(vad->calls, 0);
  EXPECT_EQ(detector.state().consecutive_silence, 1);
}

TEST(SilenceDetector, EmptyChunkLeavesStateAlone)
{
  auto vad = std::make_shared<ScriptedClassifier>(std::deque<std::optional<bool>>{}, true);
  SilenceDetector detector(8000, vad);
  detector.process_chunk(AudioChunk{}, 0.1);
  EXPECT_EQ(vad->calls, 0);
  EXPECT_EQ(detector.state().consecutive_silence, 0);
}

TEST(SilenceDetector, FrameIsPeakNormalized)
{
  auto vad = std::make_shared<ScriptedClassifier>(std::deque<std::optional<bool>>{}, true);
  SilenceDetector detector(16000, vad);
  AudioChunk chunk = constant_chunk(0.0F, 1600, 16000);
  chunk.samples[10] = 0.25F;
  chunk.samples[11] = -0.125F;
  detector.process_chunk(chunk, 0.1);
  ASSERT_EQ(vad->last_frame.size(), 480u);
  EXPECT_EQ(vad->last_frame[10], 32767);
  EXPECT_EQ(vad->last_frame[11], -16383);
}

TEST(SilenceDetector, ResetRestoresInitialStateAndResetsClassifier)
{
  auto vad = std::make_shared<ScriptedClassifier>(std::deque<std::optional<bool>>{S, S, N, N, N, N});
  SilenceDetector detector(8000, vad);
  for (int i = 0; i < 6; ++i) {
    detector.process_chunk(constant_chunk(0.2F), 0.1 * (i + 1));
  }
  detector.reset();
  EXPECT_EQ(vad->resets, 1);
  EXPECT_FALSE(detector.state().speech_active);
  EXPECT_FALSE(detector.state().silence_start.has_value());
  EXPECT_EQ(detector.state().silence_duration, 0.0);
  EXPECT_EQ(detector.state().consecutive_speech, 0);
  EXPECT_EQ(detector.state().consecutive_silence, 0);
  EXPECT_EQ(detector.last_speech_time(), 0.0);
}

TEST(EnergyVad, RejectsSilenceAndNoise)
{
  detect_cpp::EnergyVad vad;
  const std::vector<int16_t> zeros(240, 0);
  EXPECT_EQ(vad.classify(zeros, 8000), std::optional<bool>(false));

  std::mt19937 gen(7);
  std::uniform_int_distribution<int> dist(-32767, 32767);
  std::vector<int16_t> noise(240);
  for (auto & s : noise) {
    s = static_cast<int16_t>(dist(gen));
  }
  EXPECT_EQ(vad.classify(noise, 8000), std::optional<bool>(false));
}

TEST(EnergyVad, AcceptsLoudVoicedSignal)
{
  detect_cpp::EnergyVad vad;
  std::vector<int16_t> voiced(240);
  for (size_t i = 0; i < voiced.size(); ++i) {
    voiced[i] = static_cast<int16_t>(32767.0 * std::sin(2.0 * 3.14159265358979 * 200.0 * i / 8000.0));
  }
  EXPECT_EQ(vad.classify(voiced, 8000), std::optional<bool>(true));
  EXPECT_FALSE(vad.classify({}, 8000).has_value());
}

TEST(VoiceClassifierFactory, EmptyModelPathSelectsEnergyVad)
{
  std::string error;
  auto vad = detect_cpp::make_voice_classifier(detect_cpp::VadSelection{}, error);
  ASSERT_NE(vad, nullptr);
  EXPECT_EQ(vad->name(), "energy");
  EXPECT_TRUE(error.empty());
}

TEST(VoiceClassifierFactory, MissingModelFileFails)
{
  detect_cpp::VadSelection selection;
  selection.silero_model_path = "/nonexistent/silero_vad.onnx";
  std::string error;
  EXPECT_EQ(detect_cpp::make_voice_classifier(selection, error), nullptr);
  EXPECT_FALSE(error.empty());
}

TEST(SileroLayout, WindowFollowsSampleRate)
{
  const auto wide = detect_cpp::silero_layout_for_rate(16000);
  ASSERT_TRUE(wide.has_value());
  EXPECT_EQ(wide->window, 512u);
  EXPECT_EQ(wide->context, 64u);
  EXPECT_EQ(wide->input_size(), 576u);

  const auto narrow = detect_cpp::silero_layout_for_rate(8000);
  ASSERT_TRUE(narrow.has_value());
  EXPECT_EQ(narrow->window, 256u);
  EXPECT_EQ(narrow->context, 32u);

  EXPECT_FALSE(detect_cpp::silero_layout_for_rate(44100).has_value());
  EXPECT_FALSE(detect_cpp::silero_layout_for_rate(0).has_value());
}

TEST(SileroLayout, ShortFrameIsPaddedAfterContext)
{
  const detect_cpp::SileroLayout layout{512, 64};
  const std::vector<float> context(64, 0.5F);
  // 30 ms at 16 kHz
  const std::vector<int16_t> frame(480, 16384);

  std::vector<float> input;
  ASSERT_TRUE(detect_cpp::assemble_silero_input(layout, context, frame, input));
  ASSERT_EQ(input.size(), 576u);
  EXPECT_EQ(input[0], 0.5F);
  EXPECT_EQ(input[63], 0.5F);
  EXPECT_EQ(input[64], 0.5F);
  EXPECT_EQ(input[64 + 479], 0.5F);
  EXPECT_EQ(input[64 + 480], 0.0F);
  EXPECT_EQ(input.back(), 0.0F);
}

TEST(SileroLayout, RejectsEmptyOversizeAndMismatchedInput)
{
  const detect_cpp::SileroLayout layout{256, 32};
  const std::vector<float> context(32, 0.0F);
  std::vector<float> input;
  EXPECT_FALSE(detect_cpp::assemble_silero_input(layout, context, {}, input));
  EXPECT_FALSE(detect_cpp::assemble_silero_input(layout, context, std::vector<int16_t>(257, 1), input));
  EXPECT_FALSE(
    detect_cpp::assemble_silero_input(layout, std::vector<float>(64, 0.0F), std::vector<int16_t>(240, 1), input));
  EXPECT_TRUE(detect_cpp::assemble_silero_input(layout, context, std::vector<int16_t>(256, 1), input));
}

TEST(SileroVad, WithoutModelEveryFrameIsUnclassified)
{
  detect_cpp::SileroVad vad;
  EXPECT_FALSE(vad.initialized());
  EXPECT_EQ(vad.name(), "silero");
  EXPECT_FALSE(vad.classify(std::vector<int16_t>(480, 100), 16000).has_value());
  EXPECT_FALSE(vad.classify(std::vector<int16_t>(240, 100), 8000).has_value());
  EXPECT_FALSE(vad.classify(std::vector<int16_t>(480, 100), 44100).has_value());
  EXPECT_FALSE(vad.classify(std::vector<int16_t>(2048, 100), 16000).has_value());
  vad.reset();

  EXPECT_FALSE(vad.initialize(0.5F, "/nonexistent/silero_vad.onnx"));
  EXPECT_FALSE(vad.initialized());
  EXPECT_FALSE(vad.last_error().empty());
  EXPECT_FALSE(vad.classify(std::vector<int16_t>(480, 100), 16000).has_value());
}

TEST(SileroVad, UnclassifiedFramesCountAsSilence)
{
  auto vad = std::make_shared<detect_cpp::SileroVad>();
  SilenceDetector detector(16000, vad);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(detector.process_chunk(constant_chunk(0.3F, 1600, 16000), 0.1 * (i + 1)), 0.0);
  }
  EXPECT_FALSE(detector.state().speech_active);
  EXPECT_EQ(detector.state().consecutive_silence, 5);
}
