#include <gtest/gtest.h>

#include <string>

#include "speech_segmenter_cpp/audio_types.hpp"
#include "speech_segmenter_cpp/segmenter_config.hpp"

using namespace std;
using namespace speech_segmenter_cpp;

TEST(SegmenterConfigTest, DefaultsAreValid)
{
  SegmenterConfig config;
  string error;
  EXPECT_TRUE(validate_config(config, error)) << error;
  EXPECT_EQ(frame_samples(config), 480U);
  EXPECT_EQ(config.start_consecutive, 3);
  EXPECT_EQ(config.end_consecutive, 10);
  EXPECT_EQ(config.aggressiveness, 2);
}

TEST(SegmenterConfigTest, FrameSamplesFollowRateAndDuration)
{
  SegmenterConfig config;
  config.sample_rate = 8000;
  config.frame_duration_ms = 10;
  EXPECT_EQ(frame_samples(config), 80U);
  config.sample_rate = 48000;
  config.frame_duration_ms = 20;
  EXPECT_EQ(frame_samples(config), 960U);
}

TEST(SegmenterConfigTest, RejectsFramesThatAreNotWholeSamples)
{
  SegmenterConfig config;
  config.sample_rate = 44100;
  config.frame_duration_ms = 30;
  string error;
  EXPECT_FALSE(validate_config(config, error));
  EXPECT_NE(error.find("divisible"), string::npos);
  EXPECT_THROW(require_valid_config(config), ConfigurationError);
}

TEST(SegmenterConfigTest, RejectsOutOfRangeFields)
{
  string error;
  SegmenterConfig config;

  config.sample_rate = 0;
  EXPECT_FALSE(validate_config(config, error));

  config = SegmenterConfig();
  config.frame_duration_ms = -30;
  EXPECT_FALSE(validate_config(config, error));

  config = SegmenterConfig();
  config.aggressiveness = 4;
  EXPECT_FALSE(validate_config(config, error));

  config = SegmenterConfig();
  config.start_consecutive = 0;
  EXPECT_FALSE(validate_config(config, error));

  config = SegmenterConfig();
  config.end_consecutive = 0;
  EXPECT_FALSE(validate_config(config, error));

  config = SegmenterConfig();
  config.max_segment_ms = -1;
  EXPECT_FALSE(validate_config(config, error));

  config = SegmenterConfig();
  config.poll_interval_ms = 0;
  EXPECT_FALSE(validate_config(config, error));
}

TEST(SegmenterConfigTest, ParsesOverflowPolicyNames)
{
  OverflowPolicy policy = OverflowPolicy::DROP_OLDEST;
  EXPECT_TRUE(parse_overflow_policy("drop_newest", policy));
  EXPECT_EQ(policy, OverflowPolicy::DROP_NEWEST);
  EXPECT_TRUE(parse_overflow_policy("BLOCK", policy));
  EXPECT_EQ(policy, OverflowPolicy::BLOCK_WITH_TIMEOUT);
  EXPECT_TRUE(parse_overflow_policy("Drop_Oldest", policy));
  EXPECT_EQ(policy, OverflowPolicy::DROP_OLDEST);

  EXPECT_FALSE(parse_overflow_policy("lossless", policy));
  EXPECT_EQ(policy, OverflowPolicy::DROP_OLDEST);

  EXPECT_EQ(overflow_policy_string(OverflowPolicy::BLOCK_WITH_TIMEOUT), "block_with_timeout");
}

TEST(SegmenterConfigTest, PublishThresholdExcludesBoundary)
{
  EXPECT_DOUBLE_EQ(kDefaultMinPublishSeconds, 1.0);
  EXPECT_FALSE(long_enough_to_publish(0.39, kDefaultMinPublishSeconds));
  EXPECT_FALSE(long_enough_to_publish(1.0, kDefaultMinPublishSeconds));
  EXPECT_TRUE(long_enough_to_publish(1.02, kDefaultMinPublishSeconds));

  // 0이면 모든 발화를 넘김
  EXPECT_TRUE(long_enough_to_publish(0.39, 0.0));
  EXPECT_TRUE(long_enough_to_publish(0.0, 0.0));
}
