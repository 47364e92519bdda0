#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "speech_segmenter_cpp/audio_types.hpp"

namespace speech_segmenter_cpp
{

/// 캡처 장치의 블록 크기와 무관하게 고정 길이 프레임으로 재분할
/// 남은 꼬리 샘플은 다음 블록이 들어올 때까지 carry 버퍼에 보관
class FrameAssembler
{
public:
  explicit FrameAssembler(std::size_t frame_samples);

  /// block을 carry 버퍼에 붙이고 완성된 프레임을 frames에 추가. 추가한 프레임 수 반환
  std::size_t push(const RawBlock & block, std::vector<Frame> & frames);
  std::size_t push(const int16_t * samples, std::size_t count, std::vector<Frame> & frames);

  void reset();

  std::size_t frame_samples() const { return frame_samples_; }
  std::size_t pending_samples() const { return carry_.size(); }

private:
  std::size_t frame_samples_;
  std::vector<int16_t> carry_;
};

}  // namespace speech_segmenter_cpp
