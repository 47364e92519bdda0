#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "speech_segmenter_cpp/audio_types.hpp"

namespace speech_segmenter_cpp
{

/// 현재 발화 1건의 PCM 샘플 버퍼. 처리 스레드에서만 접근
class SegmentAccumulator
{
public:
  SegmentAccumulator();

  void begin();
  void append(const Frame & frame);

  /// 누적 샘플을 넘겨주고 비활성 상태로 돌아감
  std::vector<int16_t> take();
  void discard();

  bool active() const { return active_; }
  std::size_t size_samples() const { return samples_.size(); }
  std::size_t size_bytes() const { return samples_.size() * kBytesPerSample; }
  std::size_t frame_count() const { return frame_count_; }
  double duration_seconds(int sample_rate) const;

private:
  std::vector<int16_t> samples_;
  std::size_t frame_count_;
  bool active_;
};

}  // namespace speech_segmenter_cpp
