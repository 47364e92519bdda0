#include "speech_segmenter_cpp/activity_gate.hpp"

#include <exception>
#include <iostream>
#include <utility>

using namespace std;


namespace speech_segmenter_cpp
{

ActivityGate::ActivityGate(const SegmenterConfig & config, ActivityClassifier & classifier)
: config_(config),
  frame_samples_(frame_samples(config)),
  max_segment_samples_(
    static_cast<size_t>(config.max_segment_ms) * static_cast<size_t>(config.sample_rate) / 1000U),
  classifier_(classifier),
  start_count_(0),
  end_count_(0),
  frames_processed_(0),
  classifier_failures_(0),
  utterances_(0)
{
  require_valid_config(config_);
}

void ActivityGate::set_callbacks(SpeechStartCallback on_start, SpeechEndCallback on_end)
{
  on_start_ = move(on_start);
  on_end_ = move(on_end);
}

/// 상태 전환 규칙
/// IDLE → SPEAKING: 연속 음성 프레임 start_consecutive개 (트리거 프레임 전부 세그먼트에 포함)
/// SPEAKING → IDLE: 연속 비음성 프레임 end_consecutive개 (꼬리 묵음도 세그먼트에 포함)
void ActivityGate::process(const Frame & frame)
{
  if (frame.size() != frame_samples_) {
    cerr << "[speech_segmenter_cpp] dropping frame of " << frame.size()
         << " samples (expected " << frame_samples_ << ")" << endl;
    return;
  }
  ++frames_processed_;

  const bool speech = classify(frame);
  if (speech) {
    ++start_count_;
    end_count_ = 0;
  } else {
    ++end_count_;
    start_count_ = 0;
  }

  if (state_machine_.state() == ActivityState::IDLE) {
    if (start_count_ >= config_.start_consecutive) {
      start_count_ = 0;
      begin_segment();
    } else if (speech) {
      onset_frames_.push_back(frame);
      while (onset_frames_.size() > static_cast<size_t>(config_.start_consecutive - 1)) {
        onset_frames_.pop_front();
      }
    } else {
      onset_frames_.clear();
    }
  }

  if (state_machine_.state() != ActivityState::SPEAKING) {
    return;
  }

  segment_.append(frame);

  if (end_count_ >= config_.end_consecutive) {
    end_count_ = 0;
    finalize_segment(EndReason::SILENCE);
    return;
  }

  if (max_segment_samples_ > 0 && segment_.size_samples() >= max_segment_samples_) {
    cerr << "[speech_segmenter_cpp] max segment length reached ("
         << config_.max_segment_ms << "ms)" << endl;
    start_count_ = 0;
    end_count_ = 0;
    finalize_segment(EndReason::MAX_LENGTH);
  }
}

void ActivityGate::reset()
{
  state_machine_.reset();
  start_count_ = 0;
  end_count_ = 0;
  onset_frames_.clear();
  segment_.discard();
  try {
    classifier_.reset();
  } catch (const exception & e) {
    cerr << "[speech_segmenter_cpp] classifier reset failed: " << e.what() << endl;
  }
}

/// 분류기 예외는 치명적이지 않음: 해당 프레임을 비음성으로 보고 계속 진행
bool ActivityGate::classify(const Frame & frame)
{
  try {
    return classifier_.is_speech(frame, config_.sample_rate);
  } catch (const exception & e) {
    const uint64_t failures = ++classifier_failures_;
    if (failures == 1 || failures % 100 == 0) {
      cerr << "[speech_segmenter_cpp] " << classifier_.name() << " classification failed (count="
           << failures << "): " << e.what() << endl;
    }
    return false;
  } catch (...) {
    const uint64_t failures = ++classifier_failures_;
    if (failures == 1 || failures % 100 == 0) {
      cerr << "[speech_segmenter_cpp] " << classifier_.name()
           << " classification failed with a non-standard exception (count=" << failures << ")"
           << endl;
    }
    return false;
  }
}

void ActivityGate::begin_segment()
{
  segment_.begin();
  for (const auto & onset : onset_frames_) {
    segment_.append(onset);
  }
  onset_frames_.clear();
  state_machine_.set_state(ActivityState::SPEAKING);
  notify_start();
}

void ActivityGate::finalize_segment(EndReason reason)
{
  Utterance utterance;
  utterance.duration_seconds = segment_.duration_seconds(config_.sample_rate);
  utterance.frame_count = segment_.frame_count();
  utterance.end_reason = reason;
  const vector<int16_t> samples = segment_.take();
  utterance.wav = wav_writer_.encode_pcm16_mono(samples, config_.sample_rate);

  state_machine_.set_state(ActivityState::IDLE);
  ++utterances_;
  notify_end(move(utterance));
}

void ActivityGate::notify_start()
{
  if (!on_start_) {
    return;
  }
  try {
    on_start_();
  } catch (const exception & e) {
    cerr << "[speech_segmenter_cpp] speech start callback threw: " << e.what() << endl;
  } catch (...) {
    cerr << "[speech_segmenter_cpp] speech start callback threw a non-standard exception" << endl;
  }
}

void ActivityGate::notify_end(Utterance && utterance)
{
  if (!on_end_) {
    return;
  }
  try {
    on_end_(move(utterance));
  } catch (const exception & e) {
    cerr << "[speech_segmenter_cpp] speech end callback threw: " << e.what() << endl;
  } catch (...) {
    cerr << "[speech_segmenter_cpp] speech end callback threw a non-standard exception" << endl;
  }
}

}  // namespace speech_segmenter_cpp
