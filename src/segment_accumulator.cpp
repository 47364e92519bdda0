#include "speech_segmenter_cpp/segment_accumulator.hpp"

#include <utility>

using namespace std;


namespace speech_segmenter_cpp
{

SegmentAccumulator::SegmentAccumulator()
: frame_count_(0), active_(false)
{
}

void SegmentAccumulator::begin()
{
  samples_.clear();
  frame_count_ = 0;
  active_ = true;
}

void SegmentAccumulator::append(const Frame & frame)
{
  if (!active_) {
    return;
  }
  samples_.insert(samples_.end(), frame.begin(), frame.end());
  ++frame_count_;
}

vector<int16_t> SegmentAccumulator::take()
{
  vector<int16_t> out = move(samples_);
  samples_ = vector<int16_t>();
  frame_count_ = 0;
  active_ = false;
  return out;
}

void SegmentAccumulator::discard()
{
  samples_.clear();
  samples_.shrink_to_fit();
  frame_count_ = 0;
  active_ = false;
}

double SegmentAccumulator::duration_seconds(int sample_rate) const
{
  if (sample_rate <= 0) {
    return 0.0;
  }
  return static_cast<double>(size_bytes()) /
         (static_cast<double>(sample_rate) * static_cast<double>(kBytesPerSample));
}

}  // namespace speech_segmenter_cpp
