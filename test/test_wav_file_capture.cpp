#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "speech_segmenter_cpp/wav_file_capture.hpp"
#include "speech_segmenter_cpp/wav_writer.hpp"

using namespace std;
using namespace speech_segmenter_cpp;

namespace
{
class WavFileCaptureTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    path_ = (filesystem::temp_directory_path() / "speech_segmenter_capture_test.wav").string();
    for (int i = 0; i < 5000; ++i) {
      audio_.push_back(static_cast<int16_t>(i % 2000 - 1000));
    }
    ASSERT_TRUE(WavWriter().write_pcm16_mono(path_, audio_, 16000));
  }

  void TearDown() override
  {
    error_code ec;
    filesystem::remove(path_, ec);
  }

  bool wait_for_end(chrono::milliseconds timeout = chrono::seconds(5))
  {
    unique_lock<mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return !reason_.empty(); });
  }

  CaptureSource::BlockCallback on_block()
  {
    return [this](RawBlock && block) {
        lock_guard<mutex> lock(mutex_);
        block_sizes_.push_back(block.size());
        received_.insert(received_.end(), block.begin(), block.end());
      };
  }

  CaptureSource::ErrorCallback on_error()
  {
    return [this](const string & reason) {
        {
          lock_guard<mutex> lock(mutex_);
          reason_ = reason;
        }
        cv_.notify_all();
      };
  }

  string path_;
  vector<int16_t> audio_;

  mutex mutex_;
  condition_variable cv_;
  vector<int16_t> received_;
  vector<size_t> block_sizes_;
  string reason_;
};
}  // namespace

TEST_F(WavFileCaptureTest, DeliversWholeFileThenEndOfStream)
{
  WavFileCaptureConfig config;
  config.path = path_;
  config.block_size = 1024;
  config.realtime = false;
  WavFileCapture capture(config);

  ASSERT_TRUE(capture.start(16000, on_block(), on_error())) << capture.last_error();
  ASSERT_TRUE(wait_for_end());

  lock_guard<mutex> lock(mutex_);
  EXPECT_EQ(reason_, WavFileCapture::kEndOfStream);
  EXPECT_EQ(received_, audio_);
  ASSERT_EQ(block_sizes_.size(), 5U);
  EXPECT_EQ(block_sizes_.front(), 1024U);
  EXPECT_EQ(block_sizes_.back(), 5000U - 4U * 1024U);
  EXPECT_EQ(capture.last_error(), WavFileCapture::kEndOfStream);
}

TEST_F(WavFileCaptureTest, RealtimePlaybackStopsPromptly)
{
  WavFileCaptureConfig config;
  config.path = path_;
  config.block_size = 160;  // 10ms
  config.realtime = true;
  WavFileCapture capture(config);

  ASSERT_TRUE(capture.start(16000, on_block(), on_error()));
  EXPECT_TRUE(capture.is_running());
  capture.stop();
  EXPECT_FALSE(capture.is_running());

  lock_guard<mutex> lock(mutex_);
  EXPECT_TRUE(reason_.empty());
  EXPECT_LT(received_.size(), audio_.size());
}

TEST_F(WavFileCaptureTest, SampleRateMismatchFailsStart)
{
  WavFileCaptureConfig config;
  config.path = path_;
  WavFileCapture capture(config);

  EXPECT_FALSE(capture.start(8000, on_block(), on_error()));
  EXPECT_FALSE(capture.is_running());
  EXPECT_EQ(capture.last_error().rfind("sample_rate_mismatch", 0), 0U);
}

TEST_F(WavFileCaptureTest, MissingFileFailsStart)
{
  WavFileCaptureConfig config;
  config.path = path_ + ".missing";
  WavFileCapture capture(config);

  EXPECT_FALSE(capture.start(16000, on_block(), on_error()));
  EXPECT_FALSE(capture.last_error().empty());
}
