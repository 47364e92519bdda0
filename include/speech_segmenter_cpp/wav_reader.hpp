#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace speech_segmenter_cpp
{

struct WavAudio
{
  int sample_rate = 0;
  int channels = 0;           ///< 원본 파일의 채널 수
  int bits_per_sample = 0;
  std::vector<int16_t> samples;  ///< mono로 다운믹스된 PCM16
};

/// PCM16 RIFF/WAVE 디코더. 알 수 없는 chunk는 건너뛰고 다채널은 평균으로 mono 변환
class WavReader
{
public:
  bool decode(const std::vector<uint8_t> & bytes, WavAudio & out, std::string & error) const;
  bool read_file(const std::string & file_path, WavAudio & out, std::string & error) const;
};

}  // namespace speech_segmenter_cpp
