#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/bool.hpp"
#include "std_msgs/msg/float64.hpp"
#include "std_msgs/msg/string.hpp"
#include "std_msgs/msg/u_int8_multi_array.hpp"

#include "speech_segmenter_cpp/classifier_factory.hpp"
#include "speech_segmenter_cpp/speech_segmenter.hpp"
#include "speech_segmenter_cpp/wav_writer.hpp"

namespace speech_segmenter_cpp
{

class SpeechSegmenterNode : public rclcpp::Node
{
public:
  SpeechSegmenterNode();
  ~SpeechSegmenterNode() override;

private:
  void declare_and_get_parameters();
  std::unique_ptr<CaptureSource> make_capture_source();
  void on_speech_start();
  void on_speech_end(std::vector<uint8_t> && wav_bytes, double duration_seconds);
  void on_capture_stopped(const std::string & reason);
  void publish_state(const std::string & state);

  rclcpp::Publisher<std_msgs::msg::Bool>::SharedPtr pub_speech_started_;
  rclcpp::Publisher<std_msgs::msg::UInt8MultiArray>::SharedPtr pub_utterance_wav_;
  rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr pub_utterance_duration_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_audio_path_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_state_;

  SegmenterConfig segmenter_config_;
  ClassifierConfig classifier_config_;
  WavWriter wav_writer_;

  std::string capture_backend_;
  int audio_device_index_;
  std::string audio_device_hint_;
  int channels_;
  int block_size_;
  std::string input_wav_path_;
  bool wav_realtime_;
  bool save_segments_;
  std::string wav_output_dir_;
  double min_publish_duration_;

  std::unique_ptr<SpeechSegmenter> segmenter_;
};

}  // namespace speech_segmenter_cpp
