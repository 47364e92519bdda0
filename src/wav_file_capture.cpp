#include "speech_segmenter_cpp/wav_file_capture.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

using namespace std;


namespace speech_segmenter_cpp
{

WavFileCapture::WavFileCapture(const WavFileCaptureConfig & config)
: config_(config), running_(false), stop_requested_(false)
{
}

WavFileCapture::~WavFileCapture()
{
  stop();
}

bool WavFileCapture::start(int sample_rate, BlockCallback on_block, ErrorCallback on_error)
{
  lock_guard<mutex> lifecycle_lock(lifecycle_mutex_);
  if (running_) return true;
  if (feeder_.joinable()) {
    feeder_.join();
  }

  string error;
  {
    lock_guard<mutex> lock(error_mutex_);
    last_error_.clear();
  }
  if (config_.block_size < 1) {
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = "invalid_block_size";
    return false;
  }
  if (!reader_.read_file(config_.path, audio_, error)) {
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = error;
    return false;
  }
  // 리샘플링은 하지 않음
  if (audio_.sample_rate != sample_rate) {
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = "sample_rate_mismatch: file=" + to_string(audio_.sample_rate) +
      "Hz expected=" + to_string(sample_rate) + "Hz";
    return false;
  }

  on_block_ = move(on_block);
  on_error_ = move(on_error);
  {
    lock_guard<mutex> lock(wait_mutex_);
    stop_requested_ = false;
  }
  running_ = true;
  feeder_ = thread(&WavFileCapture::feed_loop, this, sample_rate);
  return true;
}

void WavFileCapture::stop()
{
  lock_guard<mutex> lifecycle_lock(lifecycle_mutex_);
  {
    lock_guard<mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
  if (feeder_.joinable()) {
    feeder_.join();
  }
  running_ = false;
}

bool WavFileCapture::is_running() const
{
  return running_.load();
}

string WavFileCapture::last_error() const
{
  lock_guard<mutex> lock(error_mutex_);
  return last_error_;
}

void WavFileCapture::feed_loop(int sample_rate)
{
  const size_t block = static_cast<size_t>(config_.block_size);
  const auto block_period = chrono::microseconds(
    static_cast<int64_t>(block) * 1000000 / static_cast<int64_t>(sample_rate));
  auto next_deadline = chrono::steady_clock::now();

  size_t cursor = 0;
  while (cursor < audio_.samples.size()) {
    if (config_.realtime) {
      next_deadline += block_period;
      unique_lock<mutex> lock(wait_mutex_);
      wait_cv_.wait_until(lock, next_deadline, [&]() { return stop_requested_; });
      if (stop_requested_) {
        return;
      }
    } else {
      lock_guard<mutex> lock(wait_mutex_);
      if (stop_requested_) {
        return;
      }
    }

    const size_t n = min(block, audio_.samples.size() - cursor);
    const auto begin = audio_.samples.begin() + static_cast<ptrdiff_t>(cursor);
    RawBlock chunk(begin, begin + static_cast<ptrdiff_t>(n));
    cursor += n;
    if (on_block_) {
      on_block_(move(chunk));
    }
  }

  {
    lock_guard<mutex> lock(error_mutex_);
    last_error_ = kEndOfStream;
  }
  running_ = false;
  if (on_error_) {
    on_error_(kEndOfStream);
  }
}

}  // namespace speech_segmenter_cpp
