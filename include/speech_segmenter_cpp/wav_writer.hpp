#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace speech_segmenter_cpp
{

class WavWriter
{
public:
  WavWriter();

  /// PCM16 mono 샘플을 44바이트 RIFF/WAVE 헤더와 함께 메모리상에서 직렬화
  std::vector<uint8_t> encode_pcm16_mono(
    const std::vector<int16_t> & audio,
    int sample_rate) const;

  bool ensure_output_dir(const std::string & dir) const;
  std::string make_output_path(const std::string & dir) const;
  bool write_file(const std::string & file_path, const std::vector<uint8_t> & bytes) const;
  bool write_pcm16_mono(
    const std::string & file_path,
    const std::vector<int16_t> & audio,
    int sample_rate) const;

private:
  mutable unsigned sequence_;
};

}  // namespace speech_segmenter_cpp
