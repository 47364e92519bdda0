#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "speech_segmenter_cpp/activity_classifier.hpp"

namespace speech_segmenter_cpp
{

/// libfvad(WebRTC VAD) 기반 분류기
/// 지원 규격: 8/16/32/48kHz, 10/20/30ms 프레임, mode 0..3
class FvadClassifier : public ActivityClassifier
{
public:
  FvadClassifier();
  ~FvadClassifier() override;

  FvadClassifier(const FvadClassifier &) = delete;
  FvadClassifier & operator=(const FvadClassifier &) = delete;

  bool initialize(int aggressiveness, int sample_rate, std::size_t frame_samples);
  bool initialized() const { return initialized_; }
  const std::string & last_error() const { return last_error_; }

  bool is_speech(const Frame & frame, int sample_rate) override;
  void reset() override;
  std::string name() const override { return "webrtc"; }

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  bool initialized_;
  int mode_;
  int sample_rate_;
  std::size_t frame_samples_;
  std::string last_error_;
};

}  // namespace speech_segmenter_cpp
