#pragma once

#include <string>

#include "speech_segmenter_cpp/activity_classifier.hpp"

namespace speech_segmenter_cpp
{

/// 모델 없이 프레임 레벨(dBFS)로만 판별하는 분류기
/// aggressiveness가 높을수록 더 큰 소리만 음성으로 인정
class EnergyClassifier : public ActivityClassifier
{
public:
  explicit EnergyClassifier(int aggressiveness);

  bool is_speech(const Frame & frame, int sample_rate) override;
  std::string name() const override { return "energy"; }

  float threshold_dbfs() const { return threshold_dbfs_; }

  static float frame_dbfs(const Frame & frame);

private:
  float threshold_dbfs_;
};

}  // namespace speech_segmenter_cpp
