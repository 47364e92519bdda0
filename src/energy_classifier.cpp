#include "speech_segmenter_cpp/energy_classifier.hpp"

#include <array>
#include <cmath>

using namespace std;


namespace speech_segmenter_cpp
{

namespace
{
// aggressiveness 0..3 → 음성 판정 임계 레벨
constexpr array<float, 4> kThresholdsDbfs{-50.0F, -45.0F, -40.0F, -35.0F};
}  // namespace

EnergyClassifier::EnergyClassifier(int aggressiveness)
: threshold_dbfs_(0.0F)
{
  if (aggressiveness < 0 || aggressiveness > 3) {
    throw ConfigurationError("energy classifier aggressiveness must be in 0..3: " +
      to_string(aggressiveness));
  }
  threshold_dbfs_ = kThresholdsDbfs[static_cast<size_t>(aggressiveness)];
}

float EnergyClassifier::frame_dbfs(const Frame & frame)
{
  if (frame.empty()) {
    return -120.0F;
  }
  double acc = 0.0;
  for (const int16_t sample : frame) {
    acc += static_cast<double>(sample) * static_cast<double>(sample);
  }
  const double rms = sqrt(acc / static_cast<double>(frame.size()));
  const double ref = 32768.0;  // int16 max magnitude
  return static_cast<float>(20.0 * log10((rms + 1e-9) / ref));
}

bool EnergyClassifier::is_speech(const Frame & frame, int /*sample_rate*/)
{
  return frame_dbfs(frame) > threshold_dbfs_;
}

}  // namespace speech_segmenter_cpp
