#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "speech_segmenter_cpp/audio_types.hpp"
#include "speech_segmenter_cpp/segmenter_config.hpp"

namespace speech_segmenter_cpp
{

/// 캡처 스레드 → 처리 스레드 간 RawBlock 전달용 FIFO 큐
/// capacity 0이면 무제한, 그 외에는 OverflowPolicy에 따라 초과분 처리
class SampleQueue
{
public:
  explicit SampleQueue(
    std::size_t capacity = 0,
    OverflowPolicy policy = OverflowPolicy::DROP_OLDEST,
    std::chrono::milliseconds block_timeout = std::chrono::milliseconds(5));

  SampleQueue(const SampleQueue &) = delete;
  SampleQueue & operator=(const SampleQueue &) = delete;

  /// 블록을 넣는다. 블록이 버려졌거나(DROP_NEWEST, 타임아웃) 큐가 닫혔으면 false
  bool push(RawBlock block);

  /// timeout 동안 대기 후 꺼낸다. 꺼낸 블록이 없으면 false
  bool pop(RawBlock & out, std::chrono::milliseconds timeout);

  /// 이후 push를 거부. pop은 남은 블록을 모두 돌려준 뒤 즉시 false
  void close();
  void reopen();
  void clear();

  bool closed() const;
  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  OverflowPolicy policy() const { return policy_; }
  uint64_t dropped_blocks() const;

private:
  const std::size_t capacity_;
  const OverflowPolicy policy_;
  const std::chrono::milliseconds block_timeout_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<RawBlock> blocks_;
  bool closed_;
  uint64_t dropped_;
};

}  // namespace speech_segmenter_cpp
