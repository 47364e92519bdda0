#include "speech_segmenter_cpp/speech_segmenter.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

using namespace std;


namespace speech_segmenter_cpp
{

namespace
{
const SegmenterConfig & validated(const SegmenterConfig & config)
{
  require_valid_config(config);
  return config;
}

ActivityClassifier & require_classifier(const unique_ptr<ActivityClassifier> & classifier)
{
  if (!classifier) {
    throw ConfigurationError("activity classifier is required");
  }
  return *classifier;
}
}  // namespace

SpeechSegmenter::SpeechSegmenter(
  const SegmenterConfig & config,
  unique_ptr<ActivityClassifier> classifier,
  unique_ptr<CaptureSource> capture,
  SpeechStartCallback on_speech_start,
  SpeechEndCallback on_speech_end)
: config_(validated(config)),
  classifier_(move(classifier)),
  capture_(move(capture)),
  queue_(
    config_.queue_capacity, config_.overflow_policy,
    chrono::milliseconds(config_.queue_block_timeout_ms)),
  assembler_(frame_samples(config_)),
  gate_(config_, require_classifier(classifier_)),
  on_speech_start_(move(on_speech_start)),
  on_speech_end_(move(on_speech_end)),
  running_(false),
  capture_ended_(false),
  worker_id_(thread::id()),
  state_(static_cast<int>(ActivityState::IDLE))
{
  if (!capture_) {
    throw ConfigurationError("capture source is required");
  }

  gate_.set_callbacks(
    [this]() {
      state_.store(static_cast<int>(ActivityState::SPEAKING));
      if (on_speech_start_) {
        on_speech_start_();
      }
    },
    [this](Utterance && utterance) {
      state_.store(static_cast<int>(ActivityState::IDLE));
      if (on_speech_end_) {
        on_speech_end_(move(utterance.wav), utterance.duration_seconds);
      }
    });
}

SpeechSegmenter::~SpeechSegmenter()
{
  stop();
}

void SpeechSegmenter::set_capture_stopped_callback(CaptureStoppedCallback cb)
{
  lock_guard<mutex> lock(callback_mutex_);
  on_capture_stopped_ = move(cb);
}

/// 처리 스레드를 먼저 띄운 뒤 캡처를 시작 (첫 블록부터 소비 가능하도록)
bool SpeechSegmenter::start()
{
  lock_guard<mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    return true;
  }
  // 캡처 종료로 스스로 끝난 이전 처리 스레드 정리
  if (processing_thread_.joinable()) {
    processing_thread_.join();
  }
  worker_id_.store(thread::id());

  reset_pipeline();
  running_.store(true);
  processing_thread_ = thread(&SpeechSegmenter::processing_loop, this);

  const bool ok = capture_->start(
    config_.sample_rate,
    [this](RawBlock && block) { on_capture_block(move(block)); },
    [this](const string & reason) { on_capture_error(reason); });

  if (!ok) {
    running_.store(false);
    queue_.close();
    if (processing_thread_.joinable()) {
      processing_thread_.join();
    }
    worker_id_.store(thread::id());
    capture_->stop();
    reset_pipeline();
    lock_guard<mutex> error_lock(error_mutex_);
    last_error_ = capture_->last_error();
    cerr << "[speech_segmenter_cpp] failed to start capture: " << last_error_ << endl;
    return false;
  }

  cerr << "[speech_segmenter_cpp] started (sample_rate=" << config_.sample_rate
       << " frame=" << config_.frame_duration_ms << "ms start=" << config_.start_consecutive
       << " end=" << config_.end_consecutive << " queue=" << config_.queue_capacity
       << "/" << overflow_policy_string(config_.overflow_policy) << ")" << endl;
  return true;
}

void SpeechSegmenter::stop()
{
  // 콜백 안에서 호출된 경우: 자기 자신을 join할 수 없으므로 캡처만 멈추고 플래그를 내린다
  // (큐를 먼저 닫아 BLOCK_WITH_TIMEOUT push에 묶인 캡처 스레드를 깨움)
  if (this_thread::get_id() == worker_id_.load()) {
    running_.store(false);
    queue_.close();
    capture_->stop();
    return;
  }

  lock_guard<mutex> lock(lifecycle_mutex_);
  const bool was_running = running_.exchange(false);

  capture_->stop();
  queue_.close();
  if (processing_thread_.joinable()) {
    processing_thread_.join();
  }
  worker_id_.store(thread::id());

  // 진행 중이던 발화와 대기 중 블록은 내보내지 않고 버림 (last_error는 유지)
  queue_.clear();
  assembler_.reset();
  gate_.reset();
  state_.store(static_cast<int>(ActivityState::IDLE));

  if (was_running) {
    cerr << "[speech_segmenter_cpp] stopped" << endl;
  }
}

bool SpeechSegmenter::is_running() const
{
  return running_.load();
}

string SpeechSegmenter::last_error() const
{
  lock_guard<mutex> lock(error_mutex_);
  return last_error_;
}

SegmenterStats SpeechSegmenter::stats() const
{
  SegmenterStats out;
  out.frames_processed = gate_.frames_processed();
  out.dropped_blocks = queue_.dropped_blocks();
  out.classifier_failures = gate_.classifier_failures();
  out.utterances = gate_.utterances();
  return out;
}

ActivityState SpeechSegmenter::state() const
{
  return static_cast<ActivityState>(state_.load());
}

void SpeechSegmenter::reset_pipeline()
{
  queue_.clear();
  queue_.reopen();
  assembler_.reset();
  gate_.reset();
  capture_ended_.store(false);
  state_.store(static_cast<int>(ActivityState::IDLE));
  lock_guard<mutex> lock(error_mutex_);
  last_error_.clear();
}

/// 캡처 스레드: 비차단 enqueue만 수행
void SpeechSegmenter::on_capture_block(RawBlock && block)
{
  if (!running_.load()) {
    return;
  }
  if (!queue_.push(move(block))) {
    // DROP_NEWEST/타임아웃으로 버려진 블록 수는 큐가 집계
    return;
  }
}

/// 캡처 오류/스트림 종료: 큐를 닫아 처리 스레드가 남은 블록만 처리하고 끝나게 함
void SpeechSegmenter::on_capture_error(const string & reason)
{
  if (!running_.load()) {
    return;
  }
  {
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = reason;
  }
  capture_ended_.store(true);
  queue_.close();
}

/// 처리 전용 스레드: 큐 → 프레임 조립 → 분류/상태 전환 → 콜백
/// poll_interval마다 깨어나 running_ 플래그를 다시 확인
void SpeechSegmenter::processing_loop()
{
  worker_id_.store(this_thread::get_id());
  const chrono::milliseconds poll_interval(config_.poll_interval_ms);
  vector<Frame> frames;

  while (running_.load()) {
    RawBlock block;
    if (!queue_.pop(block, poll_interval)) {
      if (queue_.closed()) {
        break;
      }
      continue;
    }

    frames.clear();
    assembler_.push(block, frames);
    for (const auto & frame : frames) {
      if (!running_.load()) {
        return;
      }
      gate_.process(frame);
    }
  }

  if (!capture_ended_.load() || !running_.exchange(false)) {
    return;
  }

  // 캡처가 먼저 끝난 경우: 미완성 발화는 폐기
  gate_.reset();
  assembler_.reset();
  state_.store(static_cast<int>(ActivityState::IDLE));

  const string reason = last_error();
  cerr << "[speech_segmenter_cpp] capture stopped: " << reason << endl;

  CaptureStoppedCallback cb;
  {
    lock_guard<mutex> lock(callback_mutex_);
    cb = on_capture_stopped_;
  }
  if (!cb) {
    return;
  }
  try {
    cb(reason);
  } catch (const exception & e) {
    cerr << "[speech_segmenter_cpp] capture stopped callback threw: " << e.what() << endl;
  }
}

}  // namespace speech_segmenter_cpp
