#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "speech_segmenter_cpp/activity_classifier.hpp"
#include "speech_segmenter_cpp/segment_accumulator.hpp"
#include "speech_segmenter_cpp/segmenter_config.hpp"
#include "speech_segmenter_cpp/state_machine.hpp"
#include "speech_segmenter_cpp/wav_writer.hpp"

namespace speech_segmenter_cpp
{

enum class EndReason
{
  SILENCE,
  MAX_LENGTH
};

/// speech-end 시 넘겨지는 발화 1건. 소유권은 콜백으로 이전
struct Utterance
{
  std::vector<uint8_t> wav;
  double duration_seconds = 0.0;
  std::size_t frame_count = 0;
  EndReason end_reason = EndReason::SILENCE;
};

/// 프레임 분류 결과에 연속 프레임 hysteresis를 적용해 IDLE/SPEAKING 전환을 결정
/// 처리 스레드 1개에서만 호출된다 (내부 잠금 없음)
class ActivityGate
{
public:
  using SpeechStartCallback = std::function<void()>;
  using SpeechEndCallback = std::function<void(Utterance && utterance)>;

  ActivityGate(const SegmenterConfig & config, ActivityClassifier & classifier);

  ActivityGate(const ActivityGate &) = delete;
  ActivityGate & operator=(const ActivityGate &) = delete;

  void set_callbacks(SpeechStartCallback on_start, SpeechEndCallback on_end);

  /// 프레임 1개 처리: 분류 → 카운터 갱신 → 전환 판단 → 세그먼트 누적
  void process(const Frame & frame);

  /// IDLE 복귀, 카운터 0, 진행 중 세그먼트 폐기, 분류기 상태 초기화
  void reset();

  ActivityState state() const { return state_machine_.state(); }
  std::string state_string() const { return state_machine_.state_string(); }
  int start_count() const { return start_count_; }
  int end_count() const { return end_count_; }
  std::size_t segment_samples() const { return segment_.size_samples(); }

  uint64_t frames_processed() const { return frames_processed_.load(); }
  uint64_t classifier_failures() const { return classifier_failures_.load(); }
  uint64_t utterances() const { return utterances_.load(); }

private:
  bool classify(const Frame & frame);
  void begin_segment();
  void finalize_segment(EndReason reason);
  void notify_start();
  void notify_end(Utterance && utterance);

  const SegmenterConfig config_;
  const std::size_t frame_samples_;
  const std::size_t max_segment_samples_;
  ActivityClassifier & classifier_;

  StateMachine state_machine_;
  SegmentAccumulator segment_;
  WavWriter wav_writer_;

  int start_count_;
  int end_count_;
  // IDLE 중 연속된 음성 프레임 (start 확정 시 세그먼트 앞부분이 됨)
  std::deque<Frame> onset_frames_;

  SpeechStartCallback on_start_;
  SpeechEndCallback on_end_;

  std::atomic<uint64_t> frames_processed_;
  std::atomic<uint64_t> classifier_failures_;
  std::atomic<uint64_t> utterances_;
};

}  // namespace speech_segmenter_cpp
