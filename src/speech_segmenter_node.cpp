#include "speech_segmenter_cpp/speech_segmenter_node.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <utility>

#include "speech_segmenter_cpp/portaudio_capture.hpp"
#include "speech_segmenter_cpp/wav_file_capture.hpp"

using namespace std;


namespace speech_segmenter_cpp
{

/// 노드 초기화: 파라미터 로드 → 퍼블리셔 생성 → 분류기/캡처 생성 → 엔진 시작
SpeechSegmenterNode::SpeechSegmenterNode()
: Node("speech_segmenter_node"), audio_device_index_(-1), channels_(1), block_size_(1024),
  wav_realtime_(true), save_segments_(false), min_publish_duration_(kDefaultMinPublishSeconds)
{
  declare_and_get_parameters();

  pub_speech_started_ = create_publisher<std_msgs::msg::Bool>("/speech_segmenter/speech_started", 10);
  pub_utterance_wav_ = create_publisher<std_msgs::msg::UInt8MultiArray>(
    "/speech_segmenter/utterance_wav", 10);
  pub_utterance_duration_ = create_publisher<std_msgs::msg::Float64>(
    "/speech_segmenter/utterance_duration", 10);
  pub_audio_path_ = create_publisher<std_msgs::msg::String>("/speech_segmenter/audio_path", 10);
  pub_state_ = create_publisher<std_msgs::msg::String>("/speech_segmenter/state", 10);

  if (save_segments_ && !wav_writer_.ensure_output_dir(wav_output_dir_)) {
    RCLCPP_WARN(get_logger(), "failed to create wav_output_dir: %s", wav_output_dir_.c_str());
  }

  try {
    auto classifier = make_classifier(classifier_config_, segmenter_config_);
    RCLCPP_INFO(
      get_logger(), "classifier: %s (aggressiveness=%d)",
      classifier->name().c_str(), segmenter_config_.aggressiveness);

    segmenter_ = make_unique<SpeechSegmenter>(
      segmenter_config_, move(classifier), make_capture_source(),
      bind(&SpeechSegmenterNode::on_speech_start, this),
      bind(&SpeechSegmenterNode::on_speech_end, this, placeholders::_1, placeholders::_2));
  } catch (const ConfigurationError & e) {
    RCLCPP_ERROR(get_logger(), "invalid configuration: %s", e.what());
    throw;
  }
  segmenter_->set_capture_stopped_callback(
    bind(&SpeechSegmenterNode::on_capture_stopped, this, placeholders::_1));

  if (!segmenter_->start()) {
    RCLCPP_ERROR(
      get_logger(), "failed to start speech segmenter: %s",
      segmenter_->last_error().c_str());
    publish_state("stopped");
    return;
  }

  publish_state("idle");
  RCLCPP_INFO(get_logger(), "speech_segmenter_cpp node started");
}

SpeechSegmenterNode::~SpeechSegmenterNode()
{
  if (segmenter_) {
    segmenter_->stop();
    const SegmenterStats stats = segmenter_->stats();
    RCLCPP_INFO(
      get_logger(),
      "frames=%lu utterances=%lu dropped_blocks=%lu classifier_failures=%lu",
      static_cast<unsigned long>(stats.frames_processed),
      static_cast<unsigned long>(stats.utterances),
      static_cast<unsigned long>(stats.dropped_blocks),
      static_cast<unsigned long>(stats.classifier_failures));
  }
}

void SpeechSegmenterNode::declare_and_get_parameters()
{
  declare_parameter<int>("sample_rate", 16000);
  declare_parameter<int>("frame_duration_ms", 30);
  declare_parameter<int>("aggressiveness", 2);
  declare_parameter<int>("start_consecutive", 3);
  declare_parameter<int>("end_consecutive", 10);
  declare_parameter<int>("max_segment_ms", 0);
  declare_parameter<int>("queue_capacity", 256);
  declare_parameter<string>("queue_overflow_policy", "drop_oldest");
  declare_parameter<int>("queue_block_timeout_ms", 5);
  declare_parameter<int>("poll_interval_ms", 100);

  declare_parameter<string>("classifier", "webrtc");
  declare_parameter<string>("vad_model_path", "");
  declare_parameter<double>("vad_threshold", -1.0);

  declare_parameter<string>("capture_backend", "portaudio");
  declare_parameter<int>("audio_device_index", -1);
  declare_parameter<string>("audio_device_hint", "");
  declare_parameter<int>("channels", 1);
  declare_parameter<int>("block_size", 1024);
  declare_parameter<string>("input_wav_path", "");
  declare_parameter<bool>("wav_realtime", true);

  declare_parameter<bool>("save_segments", false);
  declare_parameter<string>("wav_output_dir", "/tmp/speech_segmenter");
  declare_parameter<double>("min_publish_duration", kDefaultMinPublishSeconds);

  segmenter_config_.sample_rate = static_cast<int>(get_parameter("sample_rate").as_int());
  segmenter_config_.frame_duration_ms = static_cast<int>(get_parameter("frame_duration_ms").as_int());
  segmenter_config_.aggressiveness = static_cast<int>(get_parameter("aggressiveness").as_int());
  segmenter_config_.start_consecutive = static_cast<int>(get_parameter("start_consecutive").as_int());
  segmenter_config_.end_consecutive = static_cast<int>(get_parameter("end_consecutive").as_int());
  segmenter_config_.max_segment_ms = static_cast<int>(get_parameter("max_segment_ms").as_int());
  segmenter_config_.queue_capacity = static_cast<size_t>(
    max<int64_t>(0, get_parameter("queue_capacity").as_int()));
  segmenter_config_.queue_block_timeout_ms =
    static_cast<int>(get_parameter("queue_block_timeout_ms").as_int());
  segmenter_config_.poll_interval_ms = static_cast<int>(get_parameter("poll_interval_ms").as_int());

  const string policy = get_parameter("queue_overflow_policy").as_string();
  if (!parse_overflow_policy(policy, segmenter_config_.overflow_policy)) {
    RCLCPP_WARN(
      get_logger(), "unknown queue_overflow_policy '%s'. using drop_oldest", policy.c_str());
    segmenter_config_.overflow_policy = OverflowPolicy::DROP_OLDEST;
  }

  classifier_config_.backend = get_parameter("classifier").as_string();
  classifier_config_.model_path = get_parameter("vad_model_path").as_string();
  classifier_config_.threshold = static_cast<float>(get_parameter("vad_threshold").as_double());

  capture_backend_ = get_parameter("capture_backend").as_string();
  audio_device_index_ = static_cast<int>(get_parameter("audio_device_index").as_int());
  audio_device_hint_ = get_parameter("audio_device_hint").as_string();
  channels_ = static_cast<int>(get_parameter("channels").as_int());
  block_size_ = static_cast<int>(get_parameter("block_size").as_int());
  input_wav_path_ = get_parameter("input_wav_path").as_string();
  wav_realtime_ = get_parameter("wav_realtime").as_bool();

  save_segments_ = get_parameter("save_segments").as_bool();
  wav_output_dir_ = get_parameter("wav_output_dir").as_string();
  min_publish_duration_ = get_parameter("min_publish_duration").as_double();

  // 파일을 실시간보다 빠르게 흘리면 큐가 가득 차므로 블록을 버리지 않도록 무제한으로
  if (capture_backend_ == "wav_file" && !wav_realtime_ && segmenter_config_.queue_capacity > 0) {
    RCLCPP_INFO(get_logger(), "wav_realtime=false: queue set to unbounded");
    segmenter_config_.queue_capacity = 0;
  }
}

unique_ptr<CaptureSource> SpeechSegmenterNode::make_capture_source()
{
  if (capture_backend_ == "wav_file") {
    WavFileCaptureConfig cfg;
    cfg.path = input_wav_path_;
    cfg.block_size = block_size_;
    cfg.realtime = wav_realtime_;
    RCLCPP_INFO(
      get_logger(), "capture: wav_file %s (realtime=%s)",
      input_wav_path_.c_str(), wav_realtime_ ? "true" : "false");
    return make_unique<WavFileCapture>(cfg);
  }
  if (capture_backend_ != "portaudio") {
    throw ConfigurationError("unknown capture_backend: " + capture_backend_);
  }

  PortAudioConfig cfg;
  cfg.device_index = audio_device_index_;
  cfg.channels = channels_;
  cfg.block_size = block_size_;
  if (!audio_device_hint_.empty()) {
    cfg.preferred_device_keywords.push_back(audio_device_hint_);
  }
  cfg.preferred_device_keywords.push_back("usb");
  RCLCPP_INFO(
    get_logger(), "capture: portaudio device_index=%d channels=%d block_size=%d",
    audio_device_index_, channels_, block_size_);
  return make_unique<PortAudioCapture>(cfg);
}

/// 처리 스레드에서 호출됨
void SpeechSegmenterNode::on_speech_start()
{
  std_msgs::msg::Bool msg;
  msg.data = true;
  pub_speech_started_->publish(msg);
  publish_state("speaking");
  RCLCPP_INFO(get_logger(), "speech start");
}

/// 처리 스레드에서 호출됨: WAV 바이트 + 길이 발행, 필요 시 파일로 저장
void SpeechSegmenterNode::on_speech_end(vector<uint8_t> && wav_bytes, double duration_seconds)
{
  publish_state("idle");
  RCLCPP_INFO(
    get_logger(), "speech end: duration=%.2fs wav_size=%zu bytes",
    duration_seconds, wav_bytes.size());

  if (!long_enough_to_publish(duration_seconds, min_publish_duration_)) {
    RCLCPP_INFO(
      get_logger(), "utterance too short (%.2fs <= %.2fs), skipping",
      duration_seconds, min_publish_duration_);
    return;
  }

  if (save_segments_) {
    const string file_path = wav_writer_.make_output_path(wav_output_dir_);
    if (wav_writer_.write_file(file_path, wav_bytes)) {
      std_msgs::msg::String path_msg;
      path_msg.data = file_path;
      pub_audio_path_->publish(path_msg);
      RCLCPP_INFO(get_logger(), "saved %s", file_path.c_str());
    } else {
      RCLCPP_WARN(get_logger(), "failed to write audio file: %s", file_path.c_str());
    }
  }

  std_msgs::msg::Float64 duration_msg;
  duration_msg.data = duration_seconds;
  pub_utterance_duration_->publish(duration_msg);

  std_msgs::msg::UInt8MultiArray wav_msg;
  wav_msg.data = move(wav_bytes);
  pub_utterance_wav_->publish(wav_msg);
}

void SpeechSegmenterNode::on_capture_stopped(const string & reason)
{
  if (reason == WavFileCapture::kEndOfStream) {
    RCLCPP_INFO(get_logger(), "input wav finished");
  } else {
    RCLCPP_ERROR(get_logger(), "audio capture stopped: %s", reason.c_str());
  }
  publish_state("stopped");
}

void SpeechSegmenterNode::publish_state(const string & state)
{
  std_msgs::msg::String msg;
  msg.data = state;
  pub_state_->publish(msg);
}

}  // namespace speech_segmenter_cpp

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  shared_ptr<speech_segmenter_cpp::SpeechSegmenterNode> node;
  try {
    node = make_shared<speech_segmenter_cpp::SpeechSegmenterNode>();
  } catch (const speech_segmenter_cpp::ConfigurationError & e) {
    RCLCPP_FATAL(rclcpp::get_logger("speech_segmenter_node"), "startup failed: %s", e.what());
    rclcpp::shutdown();
    return 1;
  }
  rclcpp::spin(node);
  node.reset();
  rclcpp::shutdown();
  return 0;
}
