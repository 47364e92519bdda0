#include "speech_segmenter_cpp/fvad_classifier.hpp"

#include <fvad.h>

#include <iostream>

using namespace std;


namespace speech_segmenter_cpp
{

struct FvadClassifier::Impl
{
  Fvad * vad = nullptr;

  ~Impl()
  {
    if (vad) {
      fvad_free(vad);
      vad = nullptr;
    }
  }
};

FvadClassifier::FvadClassifier()
: impl_(make_unique<Impl>()), initialized_(false), mode_(0), sample_rate_(0), frame_samples_(0)
{
}

FvadClassifier::~FvadClassifier() = default;

bool FvadClassifier::initialize(int aggressiveness, int sample_rate, size_t frame_samples)
{
  initialized_ = false;
  last_error_.clear();

  if (impl_->vad) {
    fvad_free(impl_->vad);
    impl_->vad = nullptr;
  }

  // WebRTC VAD는 10/20/30ms 프레임만 처리
  const size_t per_ms = static_cast<size_t>(sample_rate) / 1000U;
  if (per_ms == 0 ||
      (frame_samples != per_ms * 10 && frame_samples != per_ms * 20 && frame_samples != per_ms * 30))
  {
    last_error_ = "webrtc vad requires 10/20/30ms frames, got " + to_string(frame_samples) +
      " samples at " + to_string(sample_rate) + "Hz";
    return false;
  }

  impl_->vad = fvad_new();
  if (!impl_->vad) {
    last_error_ = "fvad_new failed";
    return false;
  }
  if (fvad_set_sample_rate(impl_->vad, sample_rate) < 0) {
    last_error_ = "invalid sample rate for webrtc vad: " + to_string(sample_rate);
    fvad_free(impl_->vad);
    impl_->vad = nullptr;
    return false;
  }
  if (fvad_set_mode(impl_->vad, aggressiveness) < 0) {
    last_error_ = "invalid webrtc vad mode: " + to_string(aggressiveness);
    fvad_free(impl_->vad);
    impl_->vad = nullptr;
    return false;
  }

  mode_ = aggressiveness;
  sample_rate_ = sample_rate;
  frame_samples_ = frame_samples;
  initialized_ = true;
  cerr << "[speech_segmenter_cpp] webrtc vad initialized (sample_rate=" << sample_rate
       << "Hz, frame=" << frame_samples << " samples, mode=" << aggressiveness << ")" << endl;
  return true;
}

bool FvadClassifier::is_speech(const Frame & frame, int sample_rate)
{
  if (!initialized_ || !impl_->vad) {
    throw ClassifierError("webrtc vad is not initialized");
  }
  if (sample_rate != sample_rate_ || frame.size() != frame_samples_) {
    throw ClassifierError("webrtc vad frame mismatch: " + to_string(frame.size()) +
      " samples at " + to_string(sample_rate) + "Hz");
  }

  const int result = fvad_process(impl_->vad, frame.data(), frame.size());
  if (result < 0) {
    throw ClassifierError("fvad_process failed");
  }
  return result == 1;
}

void FvadClassifier::reset()
{
  if (!impl_->vad) {
    return;
  }
  // fvad_reset은 mode와 sample rate까지 기본값으로 되돌리므로 다시 설정
  fvad_reset(impl_->vad);
  if (fvad_set_sample_rate(impl_->vad, sample_rate_) < 0 ||
      fvad_set_mode(impl_->vad, mode_) < 0)
  {
    cerr << "[speech_segmenter_cpp] webrtc vad reconfigure after reset failed" << endl;
    initialized_ = false;
  }
}

}  // namespace speech_segmenter_cpp
