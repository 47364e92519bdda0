#include "speech_segmenter_cpp/portaudio_capture.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

using namespace std;


namespace speech_segmenter_cpp
{

namespace
{
string to_lower(string s)
{
  transform(
    s.begin(), s.end(), s.begin(),
    [](unsigned char c) { return static_cast<char>(tolower(c)); });
  return s;
}
}  // namespace

PortAudioCapture::PortAudioCapture(const PortAudioConfig & config)
: config_(config),
  sample_rate_(16000),
  selected_device_index_(paNoDevice),
  running_(false),
  stopping_(false),
  error_reported_(false),
  initialized_(false),
  stream_(nullptr)
{
  for (auto & keyword : config_.preferred_device_keywords) {
    keyword = to_lower(keyword);
  }
}

PortAudioCapture::~PortAudioCapture()
{
  stop();
}

bool PortAudioCapture::supports_format_(int device_index, int sample_rate) const
{
  const PaDeviceInfo * info = Pa_GetDeviceInfo(device_index);
  if (!info || info->maxInputChannels < config_.channels) return false;

  PaStreamParameters in_params{};
  in_params.device = device_index;
  in_params.channelCount = config_.channels;
  in_params.sampleFormat = paInt16;
  in_params.suggestedLatency = info->defaultLowInputLatency;
  in_params.hostApiSpecificStreamInfo = nullptr;

  return Pa_IsFormatSupported(&in_params, nullptr, static_cast<double>(sample_rate)) ==
         paFormatIsSupported;
}

/// 입력 디바이스 선택 우선순위:
/// 1) 설정된 인덱스  2) 이름에 선호 키워드가 포함된 장치  3) 시스템 기본 장치  4) 포맷을 지원하는 첫 장치
int PortAudioCapture::resolve_device_index_(int sample_rate) const
{
  const int device_count = Pa_GetDeviceCount();
  if (device_count <= 0) return paNoDevice;

  if (config_.device_index >= 0 &&
      config_.device_index < device_count &&
      supports_format_(config_.device_index, sample_rate))
  {
    return config_.device_index;
  }

  int first_supported = paNoDevice;
  for (int i = 0; i < device_count; ++i) {
    if (!supports_format_(i, sample_rate)) continue;
    if (first_supported == paNoDevice) first_supported = i;

    const PaDeviceInfo * info = Pa_GetDeviceInfo(i);
    const string name = to_lower(info && info->name ? info->name : "");
    for (const auto & keyword : config_.preferred_device_keywords) {
      if (!keyword.empty() && name.find(keyword) != string::npos) {
        return i;
      }
    }
  }

  const int default_device = Pa_GetDefaultInputDevice();
  if (default_device != paNoDevice && supports_format_(default_device, sample_rate)) {
    return default_device;
  }

  return first_supported;
}

/// PortAudio 초기화 → 디바이스 선택 → int16 입력 스트림 오픈 → 콜백 루프 시작
bool PortAudioCapture::start(int sample_rate, BlockCallback on_block, ErrorCallback on_error)
{
  lock_guard<mutex> stream_lock(stream_mutex_);
  if (running_) return true;

  {
    lock_guard<mutex> lock(error_mutex_);
    last_error_.clear();
    if (config_.channels < 1 || config_.block_size < 1) {
      last_error_ = "invalid_capture_config";
      return false;
    }
  }

  sample_rate_ = sample_rate;
  on_block_ = move(on_block);
  on_error_ = move(on_error);
  stopping_ = false;
  error_reported_ = false;
  selected_device_index_ = paNoDevice;
  selected_device_name_.clear();

  PaError err;

  if (!initialized_) {
    err = Pa_Initialize();
    if (err != paNoError) {
      lock_guard<mutex> lock(error_mutex_);
      last_error_ = Pa_GetErrorText(err);
      return false;
    }
    initialized_ = true;
  }

  const int dev = resolve_device_index_(sample_rate);
  if (dev == paNoDevice) {
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = "no_supported_input_device";
    return false;
  }

  const PaDeviceInfo * dev_info = Pa_GetDeviceInfo(dev);
  if (!dev_info) {
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = "invalid_device_info";
    return false;
  }
  selected_device_index_ = dev;
  selected_device_name_ = dev_info->name ? dev_info->name : "";

  PaStreamParameters in_params;
  in_params.device = dev;
  in_params.channelCount = config_.channels;
  in_params.sampleFormat = paInt16;
  in_params.suggestedLatency = dev_info->defaultLowInputLatency;
  in_params.hostApiSpecificStreamInfo = nullptr;

  if (stream_) {
    Pa_CloseStream(stream_);
    stream_ = nullptr;
  }

  err = Pa_OpenStream(
    &stream_,
    &in_params,
    nullptr,                 // output 없음
    static_cast<double>(sample_rate),
    static_cast<unsigned long>(config_.block_size),
    paNoFlag,
    &PortAudioCapture::pa_callback,
    this
  );
  if (err != paNoError) {
    stream_ = nullptr;
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = Pa_GetErrorText(err);
    return false;
  }

  err = Pa_SetStreamFinishedCallback(stream_, &PortAudioCapture::pa_finished);
  if (err != paNoError) {
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = Pa_GetErrorText(err);
    return false;
  }

  running_ = true;
  err = Pa_StartStream(stream_);
  if (err != paNoError) {
    running_ = false;
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = Pa_GetErrorText(err);
    return false;
  }

  cerr << "[speech_segmenter_cpp] audio input started: index=" << selected_device_index_
       << " name=" << selected_device_name_ << " rate=" << sample_rate
       << " block=" << config_.block_size << endl;
  return true;
}

/// 엔진 처리 스레드와 소유자 스레드가 동시에 호출할 수 있음
void PortAudioCapture::stop()
{
  lock_guard<mutex> stream_lock(stream_mutex_);
  stopping_ = true;
  running_ = false;

  if (stream_) {
    if (Pa_IsStreamActive(stream_) == 1) {
      Pa_StopStream(stream_);
    }
    Pa_CloseStream(stream_);
    stream_ = nullptr;
  }

  if (initialized_) {
    Pa_Terminate();
    initialized_ = false;
  }
}

bool PortAudioCapture::is_running() const
{
  return running_.load();
}

string PortAudioCapture::last_error() const
{
  lock_guard<mutex> lock(error_mutex_);
  return last_error_;
}

int PortAudioCapture::selected_device_index() const
{
  return selected_device_index_;
}

string PortAudioCapture::selected_device_name() const
{
  return selected_device_name_;
}

void PortAudioCapture::report_error_(const string & reason)
{
  {
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = reason;
  }
  if (error_reported_.exchange(true)) {
    return;
  }
  running_ = false;
  if (on_error_) {
    on_error_(reason);
  }
}

/// PortAudio 콜백 (오디오 스레드): int16 → mono 변환 후 등록된 콜백으로 바로 전달
int PortAudioCapture::pa_callback(const void * input,
                                  void * /*output*/,
                                  unsigned long frameCount,
                                  const PaStreamCallbackTimeInfo * /*timeInfo*/,
                                  PaStreamCallbackFlags /*statusFlags*/,
                                  void * userData)
{
  auto * self = static_cast<PortAudioCapture *>(userData);
  if (!self || !self->running_.load()) return paComplete;

  const auto * in = static_cast<const int16_t *>(input);
  const int channels = self->config_.channels;
  RawBlock block(frameCount, 0);
  if (in) {
    if (channels == 1) {
      copy(in, in + frameCount, block.begin());
    } else {
      for (unsigned long i = 0; i < frameCount; ++i) {
        int32_t acc = 0;
        for (int c = 0; c < channels; ++c) {
          acc += in[i * static_cast<unsigned long>(channels) + static_cast<unsigned long>(c)];
        }
        block[i] = static_cast<int16_t>(acc / channels);
      }
    }
  }

  if (self->on_block_) {
    self->on_block_(move(block));
  }
  return paContinue;
}

/// 스트림이 stop() 외의 이유로 끝나면 장치 오류로 간주
void PortAudioCapture::pa_finished(void * userData)
{
  auto * self = static_cast<PortAudioCapture *>(userData);
  if (!self || self->stopping_.load()) return;
  self->report_error_("audio_stream_finished_unexpectedly");
}

}  // namespace speech_segmenter_cpp
