#include "speech_segmenter_cpp/wav_reader.hpp"

#include <cstring>
#include <fstream>
#include <iterator>

using namespace std;


namespace speech_segmenter_cpp
{

namespace
{
uint16_t read_u16_le(const uint8_t * p)
{
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32_le(const uint8_t * p)
{
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

bool tag_equals(const uint8_t * p, const char * tag)
{
  return memcmp(p, tag, 4) == 0;
}
}  // namespace

bool WavReader::decode(const vector<uint8_t> & bytes, WavAudio & out, string & error) const
{
  if (bytes.size() < 12 || !tag_equals(bytes.data(), "RIFF") || !tag_equals(bytes.data() + 8, "WAVE")) {
    error = "not_a_riff_wave_container";
    return false;
  }

  bool have_fmt = false;
  uint16_t format_tag = 0;
  uint16_t channels = 0;
  uint32_t sample_rate = 0;
  uint16_t bits_per_sample = 0;

  size_t pos = 12;
  while (pos + 8 <= bytes.size()) {
    const uint8_t * chunk = bytes.data() + pos;
    const uint32_t chunk_size = read_u32_le(chunk + 4);
    const size_t body = pos + 8;
    if (body + chunk_size > bytes.size()) {
      error = "truncated_chunk";
      return false;
    }

    if (tag_equals(chunk, "fmt ")) {
      if (chunk_size < 16) {
        error = "fmt_chunk_too_small";
        return false;
      }
      format_tag = read_u16_le(bytes.data() + body);
      channels = read_u16_le(bytes.data() + body + 2);
      sample_rate = read_u32_le(bytes.data() + body + 4);
      bits_per_sample = read_u16_le(bytes.data() + body + 14);
      have_fmt = true;
    } else if (tag_equals(chunk, "data")) {
      if (!have_fmt) {
        error = "data_chunk_before_fmt";
        return false;
      }
      // WAVE_FORMAT_EXTENSIBLE(0xFFFE)도 PCM16이면 허용
      if ((format_tag != 1 && format_tag != 0xFFFE) || bits_per_sample != 16) {
        error = "unsupported_format: only pcm16 is supported";
        return false;
      }
      if (channels == 0 || sample_rate == 0) {
        error = "invalid_fmt_fields";
        return false;
      }

      const size_t frame_bytes = static_cast<size_t>(channels) * 2U;
      const size_t frames = chunk_size / frame_bytes;
      out.sample_rate = static_cast<int>(sample_rate);
      out.channels = channels;
      out.bits_per_sample = bits_per_sample;
      out.samples.assign(frames, 0);

      const uint8_t * data = bytes.data() + body;
      for (size_t i = 0; i < frames; ++i) {
        int32_t acc = 0;
        for (uint16_t c = 0; c < channels; ++c) {
          acc += static_cast<int16_t>(read_u16_le(data + (i * channels + c) * 2U));
        }
        out.samples[i] = static_cast<int16_t>(acc / static_cast<int32_t>(channels));
      }
      return true;
    }

    // RIFF chunk는 짝수 바이트 경계로 패딩됨
    pos = body + chunk_size + (chunk_size & 1U);
  }

  error = have_fmt ? "missing_data_chunk" : "missing_fmt_chunk";
  return false;
}

bool WavReader::read_file(const string & file_path, WavAudio & out, string & error) const
{
  ifstream in(file_path, ios::binary);
  if (!in.is_open()) {
    error = "failed_to_open: " + file_path;
    return false;
  }
  vector<uint8_t> bytes((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
  if (in.bad()) {
    error = "failed_to_read: " + file_path;
    return false;
  }
  return decode(bytes, out, error);
}

}  // namespace speech_segmenter_cpp
