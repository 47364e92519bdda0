#include "speech_segmenter_cpp/segmenter_config.hpp"

#include "speech_segmenter_cpp/audio_types.hpp"

#include <algorithm>
#include <cctype>

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

bool validate_config(const SegmenterConfig & config, string & error)
{
  if (config.sample_rate <= 0) {
    error = "sample_rate must be positive: " + to_string(config.sample_rate);
    return false;
  }
  if (config.frame_duration_ms <= 0) {
    error = "frame_duration_ms must be positive: " + to_string(config.frame_duration_ms);
    return false;
  }
  // 프레임 길이가 정수 샘플로 나누어떨어져야 함 (예: 44100Hz * 30ms는 불가)
  const long long product =
    static_cast<long long>(config.sample_rate) * static_cast<long long>(config.frame_duration_ms);
  if (product % 1000 != 0) {
    error = "sample_rate * frame_duration_ms must be divisible by 1000: " +
      to_string(config.sample_rate) + "Hz x " + to_string(config.frame_duration_ms) + "ms";
    return false;
  }
  if (config.aggressiveness < 0 || config.aggressiveness > 3) {
    error = "aggressiveness must be in 0..3: " + to_string(config.aggressiveness);
    return false;
  }
  if (config.start_consecutive < 1) {
    error = "start_consecutive must be >= 1: " + to_string(config.start_consecutive);
    return false;
  }
  if (config.end_consecutive < 1) {
    error = "end_consecutive must be >= 1: " + to_string(config.end_consecutive);
    return false;
  }
  if (config.max_segment_ms < 0) {
    error = "max_segment_ms must be >= 0: " + to_string(config.max_segment_ms);
    return false;
  }
  if (config.poll_interval_ms <= 0) {
    error = "poll_interval_ms must be positive: " + to_string(config.poll_interval_ms);
    return false;
  }
  if (config.queue_block_timeout_ms < 0) {
    error = "queue_block_timeout_ms must be >= 0: " + to_string(config.queue_block_timeout_ms);
    return false;
  }
  return true;
}

void require_valid_config(const SegmenterConfig & config)
{
  string error;
  if (!validate_config(config, error)) {
    throw ConfigurationError(error);
  }
}

size_t frame_samples(const SegmenterConfig & config)
{
  return static_cast<size_t>(config.sample_rate) *
         static_cast<size_t>(config.frame_duration_ms) / 1000U;
}

bool long_enough_to_publish(double duration_seconds, double min_seconds)
{
  if (min_seconds <= 0.0) {
    return true;
  }
  return duration_seconds > min_seconds;
}

bool parse_overflow_policy(const string & name, OverflowPolicy & out)
{
  const string value = to_lower(name);
  if (value == "drop_oldest") {
    out = OverflowPolicy::DROP_OLDEST;
    return true;
  }
  if (value == "drop_newest") {
    out = OverflowPolicy::DROP_NEWEST;
    return true;
  }
  if (value == "block_with_timeout" || value == "block") {
    out = OverflowPolicy::BLOCK_WITH_TIMEOUT;
    return true;
  }
  return false;
}

string overflow_policy_string(OverflowPolicy policy)
{
  switch (policy) {
    case OverflowPolicy::DROP_OLDEST:
      return "drop_oldest";
    case OverflowPolicy::DROP_NEWEST:
      return "drop_newest";
    case OverflowPolicy::BLOCK_WITH_TIMEOUT:
      return "block_with_timeout";
    default:
      return "unknown";
  }
}

}  // namespace speech_segmenter_cpp
