#include "speech_segmenter_cpp/silero_classifier.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <vector>

#include "onnxruntime_cxx_api.h"

using namespace std;


namespace speech_segmenter_cpp
{

/// Silero VAD ONNX 모델의 내부 상태 (RNN hidden state + context 버퍼)
struct SileroClassifier::Impl
{
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "speech_segmenter_cpp_silero"};
  Ort::SessionOptions session_options;
  unique_ptr<Ort::Session> session;
  Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);

  int sample_rate = 16000;
  size_t frame_samples = 512;
  size_t context_samples = 64;

  array<int64_t, 2> input_dims{1, 576};
  array<int64_t, 3> state_dims{2, 1, 128};
  array<int64_t, 1> sr_dims{1};
  array<int64_t, 1> sr_values{16000};

  vector<float> state = vector<float>(2 * 1 * 128, 0.0F);
  vector<float> context;
  vector<float> input_buffer;

  array<const char *, 3> input_names{"input", "state", "sr"};
  array<const char *, 2> output_names{"output", "stateN"};
};

SileroClassifier::SileroClassifier()
: impl_(make_unique<Impl>()), threshold_(0.5F), initialized_(false)
{
}

SileroClassifier::~SileroClassifier() = default;

float SileroClassifier::threshold_for_aggressiveness(int aggressiveness)
{
  static constexpr array<float, 4> kThresholds{0.3F, 0.5F, 0.7F, 0.85F};
  const int index = max(0, min(3, aggressiveness));
  return kThresholds[static_cast<size_t>(index)];
}

bool SileroClassifier::initialize(
  int aggressiveness,
  const string & model_path,
  int sample_rate,
  size_t frame_samples,
  float threshold)
{
  initialized_ = false;
  last_error_.clear();

  if (aggressiveness < 0 || aggressiveness > 3) {
    last_error_ = "aggressiveness must be in 0..3: " + to_string(aggressiveness);
    return false;
  }
  threshold_ = threshold >= 0.0F ? threshold : threshold_for_aggressiveness(aggressiveness);

  // 모델이 받는 창 크기: 16kHz → 512 (+context 64), 8kHz → 256 (+context 32)
  if (sample_rate == 16000 && frame_samples == 512) {
    impl_->context_samples = 64;
  } else if (sample_rate == 8000 && frame_samples == 256) {
    impl_->context_samples = 32;
  } else {
    last_error_ = "silero vad requires 512 samples at 16000Hz or 256 at 8000Hz, got " +
      to_string(frame_samples) + " at " + to_string(sample_rate) + "Hz";
    return false;
  }

  if (model_path.empty() || !filesystem::is_regular_file(model_path)) {
    last_error_ = "invalid vad_model_path: " + model_path;
    return false;
  }

  impl_->sample_rate = sample_rate;
  impl_->frame_samples = frame_samples;
  impl_->sr_values[0] = sample_rate;
  const size_t window = impl_->context_samples + frame_samples;
  impl_->input_dims[1] = static_cast<int64_t>(window);
  impl_->context.assign(impl_->context_samples, 0.0F);
  impl_->input_buffer.assign(window, 0.0F);

  impl_->session_options.SetIntraOpNumThreads(1);
  impl_->session_options.SetInterOpNumThreads(1);
  impl_->session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

  try {
    impl_->session = make_unique<Ort::Session>(
      impl_->env, model_path.c_str(), impl_->session_options);
    reset();
    initialized_ = true;
    cerr << "[speech_segmenter_cpp] silero vad loaded: " << model_path
         << " (threshold=" << threshold_ << ")" << endl;
    return true;
  } catch (const Ort::Exception & e) {
    last_error_ = string("onnxruntime init failed: ") + e.what();
    impl_->session.reset();
    return false;
  }
}

/// 입력 구성: [이전 context | 현재 PCM 프레임] → ONNX 추론, 확률이 threshold 이상이면 true
bool SileroClassifier::is_speech(const Frame & frame, int sample_rate)
{
  if (!initialized_ || !impl_->session) {
    throw ClassifierError("silero vad is not initialized");
  }
  if (sample_rate != impl_->sample_rate || frame.size() != impl_->frame_samples) {
    throw ClassifierError("silero vad frame mismatch: " + to_string(frame.size()) +
      " samples at " + to_string(sample_rate) + "Hz");
  }

  const size_t context_size = impl_->context.size();
  copy(impl_->context.begin(), impl_->context.end(), impl_->input_buffer.begin());
  for (size_t i = 0; i < frame.size(); ++i) {
    impl_->input_buffer[i + context_size] = static_cast<float>(frame[i]) / 32768.0F;
  }

  array<Ort::Value, 3> inputs = {
    Ort::Value::CreateTensor<float>(
      impl_->memory_info, impl_->input_buffer.data(), impl_->input_buffer.size(),
      impl_->input_dims.data(), impl_->input_dims.size()),
    Ort::Value::CreateTensor<float>(
      impl_->memory_info, impl_->state.data(), impl_->state.size(),
      impl_->state_dims.data(), impl_->state_dims.size()),
    Ort::Value::CreateTensor<int64_t>(
      impl_->memory_info, impl_->sr_values.data(), impl_->sr_values.size(),
      impl_->sr_dims.data(), impl_->sr_dims.size())
  };

  try {
    auto outputs = impl_->session->Run(
      Ort::RunOptions{nullptr},
      impl_->input_names.data(),
      inputs.data(),
      inputs.size(),
      impl_->output_names.data(),
      impl_->output_names.size());

    const float prob = outputs[0].GetTensorMutableData<float>()[0];
    // RNN hidden state 갱신 + 다음 프레임용 context(마지막 context_size 샘플) 보존
    float * state_out = outputs[1].GetTensorMutableData<float>();
    memcpy(impl_->state.data(), state_out, impl_->state.size() * sizeof(float));
    copy(
      impl_->input_buffer.end() - static_cast<ptrdiff_t>(context_size),
      impl_->input_buffer.end(), impl_->context.begin());
    return prob >= threshold_;
  } catch (const Ort::Exception & e) {
    throw ClassifierError(string("onnxruntime inference failed: ") + e.what());
  }
}

void SileroClassifier::reset()
{
  fill(impl_->state.begin(), impl_->state.end(), 0.0F);
  fill(impl_->context.begin(), impl_->context.end(), 0.0F);
}

}  // namespace speech_segmenter_cpp
