#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "speech_segmenter_cpp/activity_classifier.hpp"

namespace speech_segmenter_cpp
{

/// Silero VAD(ONNX) 기반 분류기
/// 16kHz에서는 512샘플, 8kHz에서는 256샘플 프레임만 처리
class SileroClassifier : public ActivityClassifier
{
public:
  SileroClassifier();
  ~SileroClassifier() override;

  SileroClassifier(const SileroClassifier &) = delete;
  SileroClassifier & operator=(const SileroClassifier &) = delete;

  /// threshold < 0이면 aggressiveness(0..3)에서 임계값을 정함
  bool initialize(
    int aggressiveness,
    const std::string & model_path,
    int sample_rate,
    std::size_t frame_samples,
    float threshold = -1.0F);
  bool initialized() const { return initialized_; }
  float threshold() const { return threshold_; }
  const std::string & last_error() const { return last_error_; }

  bool is_speech(const Frame & frame, int sample_rate) override;
  void reset() override;
  std::string name() const override { return "silero"; }

  static float threshold_for_aggressiveness(int aggressiveness);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  float threshold_;
  bool initialized_;
  std::string last_error_;
};

}  // namespace speech_segmenter_cpp
