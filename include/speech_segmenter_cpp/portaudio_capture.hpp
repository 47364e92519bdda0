#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <portaudio.h>

#include "speech_segmenter_cpp/capture_source.hpp"

namespace speech_segmenter_cpp
{

struct PortAudioConfig
{
  int device_index = -1;        // -1이면 자동 선택
  int channels = 1;             // 2 이상이면 콜백에서 mono로 다운믹스
  int block_size = 1024;        // frames per buffer
  std::vector<std::string> preferred_device_keywords;
};

class PortAudioCapture : public CaptureSource
{
public:
  explicit PortAudioCapture(const PortAudioConfig & config);
  ~PortAudioCapture() override;

  PortAudioCapture(const PortAudioCapture &) = delete;
  PortAudioCapture & operator=(const PortAudioCapture &) = delete;

  bool start(int sample_rate, BlockCallback on_block, ErrorCallback on_error) override;
  void stop() override;
  bool is_running() const override;
  std::string last_error() const override;

  int selected_device_index() const;
  std::string selected_device_name() const;

private:
  static int pa_callback(const void * input,
                         void * output,
                         unsigned long frameCount,
                         const PaStreamCallbackTimeInfo * timeInfo,
                         PaStreamCallbackFlags statusFlags,
                         void * userData);
  static void pa_finished(void * userData);

  bool supports_format_(int device_index, int sample_rate) const;
  int  resolve_device_index_(int sample_rate) const;
  void report_error_(const std::string & reason);

private:
  PortAudioConfig config_;
  int sample_rate_;
  int selected_device_index_;
  std::string selected_device_name_;

  std::atomic<bool> running_;
  std::atomic<bool> stopping_;
  std::atomic<bool> error_reported_;
  bool initialized_;

  std::mutex stream_mutex_;
  PaStream * stream_;

  mutable std::mutex error_mutex_;
  std::string last_error_;

  BlockCallback on_block_;
  ErrorCallback on_error_;
};

}  // namespace speech_segmenter_cpp
