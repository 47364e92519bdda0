#pragma once

#include <cstddef>
#include <string>

namespace speech_segmenter_cpp
{

enum class OverflowPolicy
{
  DROP_OLDEST,
  DROP_NEWEST,
  BLOCK_WITH_TIMEOUT
};

struct SegmenterConfig
{
  int sample_rate = 16000;
  int frame_duration_ms = 30;
  // 0=least aggressive, 3=most aggressive
  int aggressiveness = 2;
  int start_consecutive = 3;   // 90ms (3 * 30ms)
  int end_consecutive = 10;    // 300ms (10 * 30ms)

  // 0이면 발화 길이 제한 없음
  int max_segment_ms = 0;

  // capacity 0 = unbounded
  std::size_t queue_capacity = 256;
  OverflowPolicy overflow_policy = OverflowPolicy::DROP_OLDEST;
  int queue_block_timeout_ms = 5;

  int poll_interval_ms = 100;
};

/// 설정 유효성 검사. 실패 시 false + error에 사유
bool validate_config(const SegmenterConfig & config, std::string & error);

/// 검사 실패 시 ConfigurationError를 던진다
void require_valid_config(const SegmenterConfig & config);

std::size_t frame_samples(const SegmenterConfig & config);

// 이 길이(초) 이하의 발화는 소비자에게 넘기지 않음
constexpr double kDefaultMinPublishSeconds = 1.0;

/// duration이 min_seconds보다 길어야 true (경계값은 제외). min_seconds <= 0이면 항상 true
bool long_enough_to_publish(double duration_seconds, double min_seconds);

bool parse_overflow_policy(const std::string & name, OverflowPolicy & out);
std::string overflow_policy_string(OverflowPolicy policy);

}  // namespace speech_segmenter_cpp
