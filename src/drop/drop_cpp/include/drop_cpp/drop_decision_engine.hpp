#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "detect_cpp/beep_detector.hpp"
#include "detect_cpp/silence_detector.hpp"
#include "detect_cpp/voice_classifier.hpp"
#include "greeting_cpp/greeting_oracle.hpp"
#include "greeting_cpp/heuristic_oracle.hpp"
#include "transcript_cpp/context_buffer.hpp"
#include "transcript_cpp/transcription_source.hpp"

#include "drop_cpp/drop_state_machine.hpp"

namespace drop_cpp
{

struct DropEngineConfig
{
  double chunk_duration_sec = 0.1;
  double silence_trigger_sec = 0.6;
  // context가 이보다 길 때만 oracle에 묻는다
  size_t min_context_chars = 10;
  // trim한 텍스트가 이보다 짧으면 완료가 아니다
  size_t min_judgeable_chars = 5;
  double speech_after_start_sec = 1.0;
  double fallback_position_ratio = 0.9;
  double progress_log_interval_sec = 1.0;

  detect_cpp::BeepDetectorConfig beep;
  detect_cpp::SilenceDetectorConfig silence;
  transcript_cpp::ContextBufferConfig context;
};

/// 녹음 하나를 고정 길이 chunk로 흘려보내며 메시지 삽입 지점을 고른다.
///
/// IDLE 동안 chunk마다:
///   1. beep 확정                                -> beep_detected
///   2. silence >= silence_trigger_sec 이고
///      인사말 context가 완료로 판단됨           -> silence_and_complete_greeting
/// 아무것도 없으면 길이의 90% 지점에 end_of_speech(첫 1초 이후 발화가 있었음)
/// 또는 end_of_audio로 삽입한다.
///
/// oracle이 UNAVAILABLE을 돌려주면 키워드 heuristic이 대신 답한다.
class DropDecisionEngine
{
public:
  DropDecisionEngine(
    const DropEngineConfig & config,
    std::shared_ptr<greeting_cpp::GreetingOracle> oracle,
    std::unique_ptr<transcript_cpp::TranscriptionSource> transcriber,
    std::shared_ptr<detect_cpp::VoiceClassifier> classifier);

  /// 파일을 디코딩할 수 없으면 std::nullopt
  std::optional<DropDecision> process_file(const std::string & path);
  DropDecision process_stream(const std::vector<float> & mono, int sample_rate);

  DropState state() const;
  std::string state_string() const;
  size_t chunks_processed() const;
  size_t oracle_queries() const;
  const transcript_cpp::ContextBuffer & context() const;
  const detect_cpp::BeepDetector & beep_detector() const;
  const detect_cpp::SilenceDetector * silence_detector() const;

private:
  void reset(int sample_rate);
  bool judge_context(const std::string & context);
  void trigger(DropReason reason, double timestamp_sec);

  DropEngineConfig config_;
  std::shared_ptr<greeting_cpp::GreetingOracle> oracle_;
  std::unique_ptr<transcript_cpp::TranscriptionSource> transcriber_;
  std::shared_ptr<detect_cpp::VoiceClassifier> classifier_;
  greeting_cpp::HeuristicOracle fallback_;

  detect_cpp::BeepDetector beep_;
  std::unique_ptr<detect_cpp::SilenceDetector> silence_;
  transcript_cpp::ContextBuffer context_;
  DropStateMachine state_machine_;

  size_t chunks_processed_;
  size_t oracle_queries_;
};

}  // namespace drop_cpp
