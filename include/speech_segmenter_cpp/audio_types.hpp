#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace speech_segmenter_cpp
{

/// 캡처 콜백 1회분의 PCM16 mono 샘플 (길이 가변)
using RawBlock = std::vector<int16_t>;

/// 분류기에 전달되는 고정 길이 프레임 (sample_rate * frame_duration_ms / 1000 샘플)
using Frame = std::vector<int16_t>;

constexpr int kBytesPerSample = 2;

/// 잘못된 설정: 생성 시점에 던지며 스레드가 시작되기 전에 실패해야 한다
class ConfigurationError : public std::runtime_error
{
public:
  explicit ConfigurationError(const std::string & what)
  : std::runtime_error(what) {}
};

/// 프레임 1개의 분류 실패. ActivityGate가 잡아서 non-speech로 처리한다
class ClassifierError : public std::runtime_error
{
public:
  explicit ClassifierError(const std::string & what)
  : std::runtime_error(what) {}
};

}  // namespace speech_segmenter_cpp
