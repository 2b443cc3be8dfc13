#include "detect_cpp/silero_vad.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <iostream>
#include <utility>

#include "onnxruntime_cxx_api.h"

using namespace std;


namespace detect_cpp
{

optional<SileroLayout> silero_layout_for_rate(int sample_rate)
{
  switch (sample_rate) {
    case 16000:
      return SileroLayout{512, 64};
    case 8000:
      return SileroLayout{256, 32};
    default:
      return nullopt;
  }
}

bool assemble_silero_input(
  const SileroLayout & layout,
  const vector<float> & context,
  const vector<int16_t> & frame,
  vector<float> & out)
{
  if (frame.empty() || frame.size() > layout.window || context.size() != layout.context) {
    return false;
  }
  out.assign(layout.input_size(), 0.0F);
  copy(context.begin(), context.end(), out.begin());
  transform(
    frame.begin(), frame.end(), out.begin() + static_cast<ptrdiff_t>(layout.context),
    [](int16_t s) {return static_cast<float>(s) / 32768.0F;});
  return true;
}

/// ONNX 세션과 프레임 사이에 이어지는 RNN state / context.
/// 샘플레이트가 바뀌면 layout을 다시 잡고 state를 비운다.
struct SileroVad::Session
{
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "detect_cpp_silero"};
  unique_ptr<Ort::Session> ort;
  Ort::MemoryInfo cpu = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);

  optional<SileroLayout> layout;
  int64_t rate = 0;
  vector<float> rnn_state = vector<float>(2 * 1 * 128, 0.0F);
  vector<float> context;
  vector<float> input;

  bool open(const string & model_path, string & error)
  {
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(1);
    options.SetInterOpNumThreads(1);
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    try {
      ort = make_unique<Ort::Session>(env, model_path.c_str(), options);
      return true;
    } catch (const Ort::Exception & e) {
      error = string("onnxruntime init failed: ") + e.what();
      ort.reset();
      return false;
    }
  }

  bool use_rate(int sample_rate)
  {
    if (layout && rate == sample_rate) {
      return true;
    }
    layout = silero_layout_for_rate(sample_rate);
    if (!layout) {
      return false;
    }
    rate = sample_rate;
    clear();
    return true;
  }

  void clear()
  {
    fill(rnn_state.begin(), rnn_state.end(), 0.0F);
    context.assign(layout ? layout->context : 0, 0.0F);
  }

  /// input에 대해 한 번 추론하고 speech 확률을 돌려준다
  optional<float> infer()
  {
    const array<int64_t, 2> input_shape{1, static_cast<int64_t>(input.size())};
    const array<int64_t, 3> state_shape{2, 1, 128};
    const array<int64_t, 1> rate_shape{1};
    array<int64_t, 1> rate_value{rate};

    array<Ort::Value, 3> tensors = {
      Ort::Value::CreateTensor<float>(
        cpu, input.data(), input.size(), input_shape.data(), input_shape.size()),
      Ort::Value::CreateTensor<float>(
        cpu, rnn_state.data(), rnn_state.size(), state_shape.data(), state_shape.size()),
      Ort::Value::CreateTensor<int64_t>(
        cpu, rate_value.data(), rate_value.size(), rate_shape.data(), rate_shape.size())
    };
    static const array<const char *, 3> kInputNames{"input", "state", "sr"};
    static const array<const char *, 2> kOutputNames{"output", "stateN"};

    try {
      auto outputs = ort->Run(
        Ort::RunOptions{nullptr},
        kInputNames.data(), tensors.data(), tensors.size(),
        kOutputNames.data(), kOutputNames.size());

      const float * next_state = outputs[1].GetTensorData<float>();
      copy(next_state, next_state + rnn_state.size(), rnn_state.begin());
      // 다음 프레임은 이번 입력의 꼬리를 context로 이어받는다
      copy(input.end() - static_cast<ptrdiff_t>(context.size()), input.end(), context.begin());
      return outputs[0].GetTensorData<float>()[0];
    } catch (const Ort::Exception & e) {
      cerr << "[detect_cpp] onnxruntime inference failed: " << e.what() << endl;
      return nullopt;
    }
  }
};

SileroVad::SileroVad()
: threshold_(0.5F)
{
}

SileroVad::~SileroVad() = default;

bool SileroVad::initialize(float threshold, const string & model_path)
{
  threshold_ = threshold;
  session_.reset();
  last_error_.clear();

  if (model_path.empty() || !filesystem::is_regular_file(model_path)) {
    last_error_ = "invalid vad model path: " + model_path;
    cerr << "[detect_cpp] " << last_error_ << endl;
    return false;
  }

  auto session = make_unique<Session>();
  if (!session->open(model_path, last_error_)) {
    cerr << "[detect_cpp] " << last_error_ << endl;
    return false;
  }
  session_ = move(session);
  return true;
}

bool SileroVad::initialized() const
{
  return session_ != nullptr;
}

const string & SileroVad::last_error() const
{
  return last_error_;
}

optional<bool> SileroVad::classify(const vector<int16_t> & frame, int sample_rate)
{
  if (!session_ || !session_->use_rate(sample_rate)) {
    return nullopt;
  }
  if (!assemble_silero_input(*session_->layout, session_->context, frame, session_->input)) {
    return nullopt;
  }
  const optional<float> prob = session_->infer();
  if (!prob) {
    return nullopt;
  }
  return *prob >= threshold_;
}

void SileroVad::reset()
{
  if (session_) {
    session_->clear();
  }
}

string SileroVad::name() const
{
  return "silero";
}

}  // namespace detect_cpp
