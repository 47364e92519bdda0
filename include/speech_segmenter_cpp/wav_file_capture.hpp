#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "speech_segmenter_cpp/capture_source.hpp"
#include "speech_segmenter_cpp/wav_reader.hpp"

namespace speech_segmenter_cpp
{

struct WavFileCaptureConfig
{
  std::string path;
  int block_size = 1024;
  // true면 블록 길이만큼 기다리며 마이크처럼 실시간 속도로 전달
  bool realtime = true;
};

/// WAV 파일을 마이크처럼 블록 단위로 흘려보내는 캡처 소스
/// 파일 끝에 도달하면 on_error("end_of_stream")으로 종료를 알린다
class WavFileCapture : public CaptureSource
{
public:
  explicit WavFileCapture(const WavFileCaptureConfig & config);
  ~WavFileCapture() override;

  WavFileCapture(const WavFileCapture &) = delete;
  WavFileCapture & operator=(const WavFileCapture &) = delete;

  bool start(int sample_rate, BlockCallback on_block, ErrorCallback on_error) override;
  void stop() override;
  bool is_running() const override;
  std::string last_error() const override;

  static constexpr const char * kEndOfStream = "end_of_stream";

private:
  void feed_loop(int sample_rate);

  WavFileCaptureConfig config_;
  WavReader reader_;
  WavAudio audio_;

  std::mutex lifecycle_mutex_;
  std::thread feeder_;
  std::atomic<bool> running_;
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  bool stop_requested_;

  mutable std::mutex error_mutex_;
  std::string last_error_;

  BlockCallback on_block_;
  ErrorCallback on_error_;
};

}  // namespace speech_segmenter_cpp
