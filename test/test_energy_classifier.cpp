#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "speech_segmenter_cpp/energy_classifier.hpp"

using namespace std;
using namespace speech_segmenter_cpp;

namespace
{
constexpr double kPi = 3.14159265358979323846;

Frame sine_frame(double amplitude, size_t samples = 480)
{
  Frame frame(samples);
  for (size_t i = 0; i < samples; ++i) {
    frame[i] = static_cast<int16_t>(amplitude * sin(2.0 * kPi * 440.0 * i / 16000.0));
  }
  return frame;
}
}  // namespace

TEST(EnergyClassifierTest, SilenceIsNotSpeech)
{
  EnergyClassifier classifier(0);
  EXPECT_FALSE(classifier.is_speech(Frame(480, 0), 16000));
  EXPECT_LT(EnergyClassifier::frame_dbfs(Frame(480, 0)), -100.0F);
}

TEST(EnergyClassifierTest, LoudToneIsSpeechAtEveryLevel)
{
  const Frame loud = sine_frame(16000.0);
  for (int level = 0; level <= 3; ++level) {
    EnergyClassifier classifier(level);
    EXPECT_TRUE(classifier.is_speech(loud, 16000)) << "aggressiveness " << level;
  }
}

TEST(EnergyClassifierTest, HigherAggressivenessRejectsQuietInput)
{
  // 약 -43 dBFS
  const Frame quiet = sine_frame(320.0);
  EXPECT_TRUE(EnergyClassifier(0).is_speech(quiet, 16000));
  EXPECT_FALSE(EnergyClassifier(3).is_speech(quiet, 16000));
  EXPECT_LT(EnergyClassifier(0).threshold_dbfs(), EnergyClassifier(3).threshold_dbfs());
}

TEST(EnergyClassifierTest, FullScaleSquareIsZeroDbfs)
{
  Frame frame(480);
  for (size_t i = 0; i < frame.size(); ++i) {
    frame[i] = (i % 2 == 0) ? 32767 : -32767;
  }
  EXPECT_NEAR(EnergyClassifier::frame_dbfs(frame), 0.0F, 0.01F);
}

TEST(EnergyClassifierTest, EmptyFrameIsFloor)
{
  EXPECT_FLOAT_EQ(EnergyClassifier::frame_dbfs(Frame()), -120.0F);
}

TEST(EnergyClassifierTest, RejectsOutOfRangeAggressiveness)
{
  EXPECT_THROW(EnergyClassifier(-1), ConfigurationError);
  EXPECT_THROW(EnergyClassifier(4), ConfigurationError);
}
