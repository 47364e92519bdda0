#pragma once

#include <memory>
#include <string>

#include "speech_segmenter_cpp/activity_classifier.hpp"
#include "speech_segmenter_cpp/segmenter_config.hpp"

namespace speech_segmenter_cpp
{

struct ClassifierConfig
{
  // "webrtc"=libfvad, "silero"=onnxruntime, "energy"=dBFS threshold
  std::string backend = "webrtc";
  std::string model_path;
  // silero 확률 임계값. 음수면 aggressiveness에서 결정
  float threshold = -1.0F;
};

/// backend 이름으로 분류기를 만들어 초기화. 실패 시 ConfigurationError
std::unique_ptr<ActivityClassifier> make_classifier(
  const ClassifierConfig & classifier_config,
  const SegmenterConfig & segmenter_config);

}  // namespace speech_segmenter_cpp
