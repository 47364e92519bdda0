#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "speech_segmenter_cpp/activity_classifier.hpp"
#include "speech_segmenter_cpp/activity_gate.hpp"
#include "speech_segmenter_cpp/capture_source.hpp"
#include "speech_segmenter_cpp/frame_assembler.hpp"
#include "speech_segmenter_cpp/sample_queue.hpp"
#include "speech_segmenter_cpp/segmenter_config.hpp"

namespace speech_segmenter_cpp
{

struct SegmenterStats
{
  uint64_t frames_processed = 0;
  uint64_t dropped_blocks = 0;
  uint64_t classifier_failures = 0;
  uint64_t utterances = 0;
};

/// 실시간 발화 분할 엔진
/// 캡처 스레드는 SampleQueue에 넣기만 하고, 프레임 조립/분류/상태 전환/콜백은
/// 전용 처리 스레드 1개에서만 수행한다
class SpeechSegmenter
{
public:
  using SpeechStartCallback = std::function<void()>;
  using SpeechEndCallback =
    std::function<void(std::vector<uint8_t> && wav_bytes, double duration_seconds)>;
  using CaptureStoppedCallback = std::function<void(const std::string & reason)>;

  /// 설정이 잘못되었으면 ConfigurationError (스레드 시작 전)
  SpeechSegmenter(
    const SegmenterConfig & config,
    std::unique_ptr<ActivityClassifier> classifier,
    std::unique_ptr<CaptureSource> capture,
    SpeechStartCallback on_speech_start,
    SpeechEndCallback on_speech_end);
  ~SpeechSegmenter();

  SpeechSegmenter(const SpeechSegmenter &) = delete;
  SpeechSegmenter & operator=(const SpeechSegmenter &) = delete;

  /// 캡처 + 처리 시작. 이미 실행 중이면 true (스레드를 새로 만들지 않음)
  bool start();

  /// 캡처 중지 → 처리 스레드 종료. 진행 중인 발화는 버린다. 여러 번 호출해도 안전
  void stop();

  bool is_running() const;
  std::string last_error() const;
  SegmenterStats stats() const;
  ActivityState state() const;

  /// 캡처 소스가 오류/스트림 종료로 멈췄을 때 처리 스레드에서 호출 (start 전에 설정)
  void set_capture_stopped_callback(CaptureStoppedCallback cb);

  const SegmenterConfig & config() const { return config_; }

private:
  void processing_loop();
  void on_capture_block(RawBlock && block);
  void on_capture_error(const std::string & reason);
  void reset_pipeline();

  const SegmenterConfig config_;
  std::unique_ptr<ActivityClassifier> classifier_;
  std::unique_ptr<CaptureSource> capture_;

  SampleQueue queue_;
  FrameAssembler assembler_;
  ActivityGate gate_;

  SpeechStartCallback on_speech_start_;
  SpeechEndCallback on_speech_end_;
  std::mutex callback_mutex_;
  CaptureStoppedCallback on_capture_stopped_;

  std::mutex lifecycle_mutex_;
  std::thread processing_thread_;
  std::atomic<bool> running_;
  std::atomic<bool> capture_ended_;
  // stop()이 처리 스레드에서 호출됐는지 판별 (processing_thread_는 lifecycle_mutex_ 아래서만 접근)
  std::atomic<std::thread::id> worker_id_;
  std::atomic<int> state_;

  mutable std::mutex error_mutex_;
  std::string last_error_;
};

}  // namespace speech_segmenter_cpp
