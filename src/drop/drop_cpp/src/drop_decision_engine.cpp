#include "drop_cpp/drop_decision_engine.hpp"

#include <drop_common/string_utils.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <utility>

#include "drop_cpp/audio_buffer.hpp"

using namespace std;


namespace drop_cpp
{

DropDecisionEngine::DropDecisionEngine(
  const DropEngineConfig & config,
  shared_ptr<greeting_cpp::GreetingOracle> oracle,
  unique_ptr<transcript_cpp::TranscriptionSource> transcriber,
  shared_ptr<detect_cpp::VoiceClassifier> classifier)
: config_(config),
  oracle_(move(oracle)),
  transcriber_(move(transcriber)),
  classifier_(move(classifier)),
  beep_(config.beep),
  context_(config.context),
  chunks_processed_(0),
  oracle_queries_(0)
{
}

void DropDecisionEngine::reset(int sample_rate)
{
  state_machine_.reset();
  beep_.reset();
  context_.reset();
  if (transcriber_) {
    transcriber_->reset();
  }
  silence_ = make_unique<detect_cpp::SilenceDetector>(sample_rate, classifier_, config_.silence);
  silence_->reset();
  chunks_processed_ = 0;
  oracle_queries_ = 0;
}

optional<DropDecision> DropDecisionEngine::process_file(const string & path)
{
  AudioBuffer audio;
  const AudioIoResult io = read_audio(path, audio);
  if (!io.ok) {
    cerr << "[drop_cpp] error loading " << path << ": " << io.error << endl;
    return nullopt;
  }
  cout << "[drop_cpp] loaded: " << path << fixed << setprecision(2)
       << " | duration: " << audio.duration_sec() << "s | sr: " << audio.sample_rate
       << " | channels: " << audio.channels << endl;
  return process_stream(audio.to_mono(), audio.sample_rate);
}

/// oracle이 UNAVAILABLE이면 heuristic 답으로 대신한다
bool DropDecisionEngine::judge_context(const string & context)
{
  const string text = drop_common::trim(context);
  if (text.size() < config_.min_judgeable_chars) {
    return false;
  }

  ++oracle_queries_;
  greeting_cpp::Judgment judgment = oracle_ ?
    oracle_->judge(text) : greeting_cpp::Judgment::unavailable("no_oracle");
  if (!judgment.available()) {
    cout << "[drop_cpp] oracle unavailable (" << judgment.error << "), using heuristic" << endl;
    judgment = fallback_.judge(text);
    judgment.raw = "HEURISTIC_FALLBACK";
  }
  cout << "[drop_cpp] greeting judged " << (judgment.complete ? "complete" : "incomplete")
       << " (" << judgment.raw << ")" << endl;
  return judgment.complete;
}

void DropDecisionEngine::trigger(DropReason reason, double timestamp_sec)
{
  if (state_machine_.trigger(reason, timestamp_sec)) {
    cout << "[drop_cpp] VOICEMAIL TRIGGERED: " << reason_string(reason) << " at "
         << fixed << setprecision(2) << timestamp_sec << "s" << endl;
  }
}

DropDecision DropDecisionEngine::process_stream(const vector<float> & mono, int sample_rate)
{
  reset(sample_rate);

  const double total_duration = sample_rate > 0 ?
    static_cast<double>(mono.size()) / static_cast<double>(sample_rate) : 0.0;
  const size_t chunk_size = max<size_t>(
    1, static_cast<size_t>(static_cast<double>(sample_rate) * config_.chunk_duration_sec));
  const size_t total_chunks = sample_rate > 0 ? (mono.size() + chunk_size - 1) / chunk_size : 0;
  const size_t log_every = max<size_t>(
    1, static_cast<size_t>(lround(config_.progress_log_interval_sec / config_.chunk_duration_sec)));

  for (size_t i = 0; i < total_chunks && state_machine_.state() == DropState::IDLE; ++i) {
    const size_t begin = i * chunk_size;
    const size_t end = min(begin + chunk_size, mono.size());

    detect_cpp::AudioChunk chunk;
    chunk.samples.assign(mono.begin() + static_cast<ptrdiff_t>(begin), mono.begin() + static_cast<ptrdiff_t>(end));
    chunk.sample_rate = sample_rate;
    chunk.index = i;

    ++chunks_processed_;
    const double now = static_cast<double>(i + 1) * config_.chunk_duration_sec;
    if (i % log_every == 0) {
      cout << "[drop_cpp] chunk " << i << "/" << total_chunks << ", " << fixed << setprecision(2)
           << now << "/" << total_duration << "s" << endl;
    }

    if (beep_.process_chunk(chunk, now)) {
      trigger(DropReason::BEEP_DETECTED, now);
      break;
    }

    const double silence = silence_->process_chunk(chunk, now);

    if (transcriber_) {
      const optional<string> fragment = transcriber_->next_fragment(total_duration, now);
      if (fragment) {
        context_.append(*fragment);
      }
    }

    if (silence + detect_cpp::kStreamTimeEpsilonSec >= config_.silence_trigger_sec) {
      const string current = context_.current_context();
      if (current.size() > config_.min_context_chars) {
        if (judge_context(current)) {
          trigger(DropReason::SILENCE_AND_COMPLETE_GREETING, now);
          break;
        }
      }
    }
  }

  if (state_machine_.state() == DropState::IDLE) {
    const double fallback_time = total_duration * config_.fallback_position_ratio;
    if (silence_->last_speech_time() > config_.speech_after_start_sec + detect_cpp::kStreamTimeEpsilonSec) {
      trigger(DropReason::END_OF_SPEECH, fallback_time);
    } else {
      trigger(DropReason::END_OF_AUDIO, fallback_time);
    }
  }
  return *state_machine_.decision();
}

DropState DropDecisionEngine::state() const
{
  return state_machine_.state();
}

string DropDecisionEngine::state_string() const
{
  return state_machine_.state_string();
}

size_t DropDecisionEngine::chunks_processed() const
{
  return chunks_processed_;
}

size_t DropDecisionEngine::oracle_queries() const
{
  return oracle_queries_;
}

const transcript_cpp::ContextBuffer & DropDecisionEngine::context() const
{
  return context_;
}

const detect_cpp::BeepDetector & DropDecisionEngine::beep_detector() const
{
  return beep_;
}

const detect_cpp::SilenceDetector * DropDecisionEngine::silence_detector() const
{
  return silence_.get();
}

}  // namespace drop_cpp
