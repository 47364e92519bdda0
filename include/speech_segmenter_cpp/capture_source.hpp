#pragma once

#include <functional>
#include <string>

#include "speech_segmenter_cpp/audio_types.hpp"

namespace speech_segmenter_cpp
{

/// 오디오 입력 장치 추상화
/// on_block은 장치 스레드에서 호출되므로 변환 + 비차단 전달 외의 작업을 하면 안 된다
/// 캡처 중 오류(또는 스트림 종료)는 on_error로 한 번 알리고 재시도하지 않는다
class CaptureSource
{
public:
  using BlockCallback = std::function<void(RawBlock && block)>;
  using ErrorCallback = std::function<void(const std::string & reason)>;

  virtual ~CaptureSource() = default;

  virtual bool start(int sample_rate, BlockCallback on_block, ErrorCallback on_error) = 0;
  virtual void stop() = 0;
  virtual bool is_running() const = 0;
  virtual std::string last_error() const = 0;
};

}  // namespace speech_segmenter_cpp
