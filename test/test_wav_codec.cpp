#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include "speech_segmenter_cpp/wav_reader.hpp"
#include "speech_segmenter_cpp/wav_writer.hpp"

using namespace std;
using namespace speech_segmenter_cpp;

namespace
{
uint32_t u32_at(const vector<uint8_t> & bytes, size_t pos)
{
  return static_cast<uint32_t>(bytes[pos]) |
         (static_cast<uint32_t>(bytes[pos + 1]) << 8) |
         (static_cast<uint32_t>(bytes[pos + 2]) << 16) |
         (static_cast<uint32_t>(bytes[pos + 3]) << 24);
}

uint16_t u16_at(const vector<uint8_t> & bytes, size_t pos)
{
  return static_cast<uint16_t>(bytes[pos] | (bytes[pos + 1] << 8));
}

string tag_at(const vector<uint8_t> & bytes, size_t pos)
{
  return string(reinterpret_cast<const char *>(bytes.data() + pos), 4);
}

void put_u32(vector<uint8_t> & out, uint32_t v)
{
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

void put_u16(vector<uint8_t> & out, uint16_t v)
{
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_tag(vector<uint8_t> & out, const char * tag)
{
  out.insert(out.end(), tag, tag + 4);
}
}  // namespace

TEST(WavWriterTest, HeaderDescribesPcm16Mono)
{
  const vector<int16_t> audio(480, 7);
  const vector<uint8_t> wav = WavWriter().encode_pcm16_mono(audio, 16000);

  ASSERT_EQ(wav.size(), 44U + 960U);
  EXPECT_EQ(tag_at(wav, 0), "RIFF");
  EXPECT_EQ(u32_at(wav, 4), 36U + 960U);
  EXPECT_EQ(tag_at(wav, 8), "WAVE");
  EXPECT_EQ(tag_at(wav, 12), "fmt ");
  EXPECT_EQ(u32_at(wav, 16), 16U);
  EXPECT_EQ(u16_at(wav, 20), 1U);        // PCM
  EXPECT_EQ(u16_at(wav, 22), 1U);        // mono
  EXPECT_EQ(u32_at(wav, 24), 16000U);
  EXPECT_EQ(u32_at(wav, 28), 32000U);    // byte rate
  EXPECT_EQ(u16_at(wav, 32), 2U);        // block align
  EXPECT_EQ(u16_at(wav, 34), 16U);
  EXPECT_EQ(tag_at(wav, 36), "data");
  EXPECT_EQ(u32_at(wav, 40), 960U);
}

TEST(WavWriterTest, SamplesAreLittleEndian)
{
  const vector<uint8_t> wav = WavWriter().encode_pcm16_mono({0x1234, -2}, 8000);
  ASSERT_EQ(wav.size(), 48U);
  EXPECT_EQ(wav[44], 0x34);
  EXPECT_EQ(wav[45], 0x12);
  EXPECT_EQ(wav[46], 0xFE);
  EXPECT_EQ(wav[47], 0xFF);
}

TEST(WavWriterTest, EmptyAudioProducesHeaderOnly)
{
  const vector<uint8_t> wav = WavWriter().encode_pcm16_mono({}, 16000);
  ASSERT_EQ(wav.size(), 44U);
  EXPECT_EQ(u32_at(wav, 40), 0U);

  WavAudio decoded;
  string error;
  ASSERT_TRUE(WavReader().decode(wav, decoded, error)) << error;
  EXPECT_TRUE(decoded.samples.empty());
}

TEST(WavReaderTest, DecodesWhatWriterEncodes)
{
  vector<int16_t> audio;
  for (int i = -500; i < 500; ++i) {
    audio.push_back(static_cast<int16_t>(i * 37));
  }
  WavAudio decoded;
  string error;
  ASSERT_TRUE(
    WavReader().decode(WavWriter().encode_pcm16_mono(audio, 48000), decoded, error)) << error;
  EXPECT_EQ(decoded.sample_rate, 48000);
  EXPECT_EQ(decoded.channels, 1);
  EXPECT_EQ(decoded.bits_per_sample, 16);
  EXPECT_EQ(decoded.samples, audio);
}

TEST(WavReaderTest, RejectsNonRiffInput)
{
  WavAudio decoded;
  string error;
  EXPECT_FALSE(WavReader().decode({'h', 'e', 'l', 'l', 'o'}, decoded, error));
  EXPECT_EQ(error, "not_a_riff_wave_container");
}

TEST(WavReaderTest, RejectsTruncatedData)
{
  vector<uint8_t> wav = WavWriter().encode_pcm16_mono(vector<int16_t>(100, 1), 16000);
  wav.resize(wav.size() - 10);
  WavAudio decoded;
  string error;
  EXPECT_FALSE(WavReader().decode(wav, decoded, error));
  EXPECT_EQ(error, "truncated_chunk");
}

TEST(WavReaderTest, SkipsUnknownChunksWithPadding)
{
  vector<uint8_t> wav;
  put_tag(wav, "RIFF");
  put_u32(wav, 0);  // 크기 필드는 검사하지 않음
  put_tag(wav, "WAVE");
  put_tag(wav, "fmt ");
  put_u32(wav, 16);
  put_u16(wav, 1);
  put_u16(wav, 1);
  put_u32(wav, 16000);
  put_u32(wav, 32000);
  put_u16(wav, 2);
  put_u16(wav, 16);
  put_tag(wav, "LIST");
  put_u32(wav, 3);  // 홀수 크기 → 1바이트 패딩
  wav.insert(wav.end(), {'a', 'b', 'c', 0});
  put_tag(wav, "data");
  put_u32(wav, 4);
  put_u16(wav, 100);
  put_u16(wav, static_cast<uint16_t>(-100));

  WavAudio decoded;
  string error;
  ASSERT_TRUE(WavReader().decode(wav, decoded, error)) << error;
  ASSERT_EQ(decoded.samples.size(), 2U);
  EXPECT_EQ(decoded.samples[0], 100);
  EXPECT_EQ(decoded.samples[1], -100);
}

TEST(WavReaderTest, DownmixesStereoByAveraging)
{
  vector<uint8_t> wav;
  put_tag(wav, "RIFF");
  put_u32(wav, 0);
  put_tag(wav, "WAVE");
  put_tag(wav, "fmt ");
  put_u32(wav, 16);
  put_u16(wav, 1);
  put_u16(wav, 2);
  put_u32(wav, 16000);
  put_u32(wav, 64000);
  put_u16(wav, 4);
  put_u16(wav, 16);
  put_tag(wav, "data");
  put_u32(wav, 8);
  put_u16(wav, 1000);
  put_u16(wav, 3000);
  put_u16(wav, static_cast<uint16_t>(-200));
  put_u16(wav, 200);

  WavAudio decoded;
  string error;
  ASSERT_TRUE(WavReader().decode(wav, decoded, error)) << error;
  EXPECT_EQ(decoded.channels, 2);
  ASSERT_EQ(decoded.samples.size(), 2U);
  EXPECT_EQ(decoded.samples[0], 2000);
  EXPECT_EQ(decoded.samples[1], 0);
}

TEST(WavReaderTest, RejectsNonPcm16)
{
  vector<uint8_t> wav;
  put_tag(wav, "RIFF");
  put_u32(wav, 0);
  put_tag(wav, "WAVE");
  put_tag(wav, "fmt ");
  put_u32(wav, 16);
  put_u16(wav, 3);  // IEEE float
  put_u16(wav, 1);
  put_u32(wav, 16000);
  put_u32(wav, 64000);
  put_u16(wav, 4);
  put_u16(wav, 32);
  put_tag(wav, "data");
  put_u32(wav, 0);

  WavAudio decoded;
  string error;
  EXPECT_FALSE(WavReader().decode(wav, decoded, error));
  EXPECT_EQ(error.rfind("unsupported_format", 0), 0U);
}

TEST(WavWriterTest, WritesFileUnderOutputDirectory)
{
  const filesystem::path dir = filesystem::temp_directory_path() / "speech_segmenter_wav_test";
  filesystem::remove_all(dir);

  WavWriter writer;
  ASSERT_TRUE(writer.ensure_output_dir(dir.string()));
  const string first = writer.make_output_path(dir.string());
  const string second = writer.make_output_path(dir.string());
  EXPECT_NE(first, second);
  EXPECT_EQ(filesystem::path(first).extension(), ".wav");

  const vector<int16_t> audio(160, 42);
  ASSERT_TRUE(writer.write_pcm16_mono(first, audio, 16000));

  WavAudio decoded;
  string error;
  ASSERT_TRUE(WavReader().read_file(first, decoded, error)) << error;
  EXPECT_EQ(decoded.samples, audio);

  filesystem::remove_all(dir);
}

TEST(WavReaderTest, MissingFileReportsError)
{
  WavAudio decoded;
  string error;
  EXPECT_FALSE(WavReader().read_file("/nonexistent/segment.wav", decoded, error));
  EXPECT_FALSE(error.empty());
}
