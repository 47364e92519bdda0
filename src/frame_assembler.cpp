#include "speech_segmenter_cpp/frame_assembler.hpp"

using namespace std;


namespace speech_segmenter_cpp
{

FrameAssembler::FrameAssembler(size_t frame_samples)
: frame_samples_(frame_samples)
{
  if (frame_samples_ == 0) {
    throw ConfigurationError("frame_samples must be positive");
  }
  carry_.reserve(frame_samples_ * 2);
}

size_t FrameAssembler::push(const RawBlock & block, vector<Frame> & frames)
{
  return push(block.data(), block.size(), frames);
}

size_t FrameAssembler::push(const int16_t * samples, size_t count, vector<Frame> & frames)
{
  if (samples == nullptr || count == 0) {
    return 0;
  }

  carry_.insert(carry_.end(), samples, samples + count);

  size_t emitted = 0;
  size_t offset = 0;
  while (carry_.size() - offset >= frame_samples_) {
    const auto begin = carry_.begin() + static_cast<ptrdiff_t>(offset);
    frames.emplace_back(begin, begin + static_cast<ptrdiff_t>(frame_samples_));
    offset += frame_samples_;
    ++emitted;
  }
  // 소비한 앞부분을 한 번에 제거 (블록이 여러 프레임을 담아도 erase는 1회)
  if (offset > 0) {
    carry_.erase(carry_.begin(), carry_.begin() + static_cast<ptrdiff_t>(offset));
  }
  return emitted;
}

void FrameAssembler::reset()
{
  carry_.clear();
}

}  // namespace speech_segmenter_cpp
