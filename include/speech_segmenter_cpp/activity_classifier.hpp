#pragma once

#include <string>

#include "speech_segmenter_cpp/audio_types.hpp"

namespace speech_segmenter_cpp
{

/// 프레임 단위 음성/비음성 판별기
/// aggressiveness 등 파라미터는 생성/초기화 시점에 고정, 호출마다 바꾸지 않는다
/// 프레임 1개 처리 실패 시 ClassifierError를 던진다
class ActivityClassifier
{
public:
  virtual ~ActivityClassifier() = default;

  virtual bool is_speech(const Frame & frame, int sample_rate) = 0;

  /// 내부 상태(RNN hidden state 등) 초기화. 상태가 없으면 아무것도 하지 않음
  virtual void reset() {}

  virtual std::string name() const = 0;
};

}  // namespace speech_segmenter_cpp
