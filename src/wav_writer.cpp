#include "speech_segmenter_cpp/wav_writer.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

using namespace std;


namespace speech_segmenter_cpp
{

namespace
{
void append_tag(vector<uint8_t> & out, const char * tag)
{
  out.insert(out.end(), tag, tag + 4);
}

void append_u16_le(vector<uint8_t> & out, uint16_t v)
{
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void append_u32_le(vector<uint8_t> & out, uint32_t v)
{
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}
}  // namespace

WavWriter::WavWriter()
: sequence_(0)
{
}

vector<uint8_t> WavWriter::encode_pcm16_mono(
  const vector<int16_t> & audio,
  int sample_rate) const
{
  constexpr uint16_t kChannels = 1;
  constexpr uint16_t kBitsPerSample = 16;
  const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * kChannels * (kBitsPerSample / 8);
  const uint16_t block_align = static_cast<uint16_t>(kChannels * (kBitsPerSample / 8));
  const uint32_t data_size = static_cast<uint32_t>(audio.size() * sizeof(int16_t));
  const uint32_t riff_size = 36 + data_size;

  vector<uint8_t> out;
  out.reserve(44 + data_size);

  append_tag(out, "RIFF");
  append_u32_le(out, riff_size);
  append_tag(out, "WAVE");

  append_tag(out, "fmt ");
  append_u32_le(out, 16);
  append_u16_le(out, 1);  // WAVE_FORMAT_PCM
  append_u16_le(out, kChannels);
  append_u32_le(out, static_cast<uint32_t>(sample_rate));
  append_u32_le(out, byte_rate);
  append_u16_le(out, block_align);
  append_u16_le(out, kBitsPerSample);

  append_tag(out, "data");
  append_u32_le(out, data_size);
  // 호스트 엔디안과 무관하게 little-endian으로 기록
  for (const int16_t sample : audio) {
    append_u16_le(out, static_cast<uint16_t>(sample));
  }

  return out;
}

bool WavWriter::ensure_output_dir(const string & dir) const
{
  error_code ec;
  filesystem::create_directories(dir, ec);
  return !ec;
}

string WavWriter::make_output_path(const string & dir) const
{
  /// 같은 초에 여러 발화가 끝나도 덮어쓰지 않도록 시퀀스 번호를 붙임
  time_t now = time(nullptr);
  tm tm_now{};
  localtime_r(&now, &tm_now);

  ostringstream oss;
  oss << dir << "/segment_" << put_time(&tm_now, "%Y%m%d_%H%M%S")
      << "_" << setw(4) << setfill('0') << sequence_++ << ".wav";
  return oss.str();
}

bool WavWriter::write_file(const string & file_path, const vector<uint8_t> & bytes) const
{
  ofstream out(file_path, ios::binary);
  if (!out.is_open()) {
    return false;
  }
  if (!bytes.empty()) {
    out.write(
      reinterpret_cast<const char *>(bytes.data()),
      static_cast<streamsize>(bytes.size()));
  }
  return out.good();
}

bool WavWriter::write_pcm16_mono(
  const string & file_path,
  const vector<int16_t> & audio,
  int sample_rate) const
{
  return write_file(file_path, encode_pcm16_mono(audio, sample_rate));
}

}  // namespace speech_segmenter_cpp
