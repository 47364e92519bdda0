#include "speech_segmenter_cpp/sample_queue.hpp"

#include <utility>

using namespace std;


namespace speech_segmenter_cpp
{

SampleQueue::SampleQueue(
  size_t capacity, OverflowPolicy policy, chrono::milliseconds block_timeout)
: capacity_(capacity), policy_(policy), block_timeout_(block_timeout),
  closed_(false), dropped_(0)
{
}

bool SampleQueue::push(RawBlock block)
{
  {
    unique_lock<mutex> lock(mutex_);
    if (closed_) {
      return false;
    }

    if (capacity_ > 0 && blocks_.size() >= capacity_) {
      switch (policy_) {
        case OverflowPolicy::DROP_OLDEST:
          // 실시간 처리 우선: 가장 오래된 블록을 버리고 새 블록 유지
          blocks_.pop_front();
          ++dropped_;
          break;
        case OverflowPolicy::DROP_NEWEST:
          ++dropped_;
          return false;
        case OverflowPolicy::BLOCK_WITH_TIMEOUT:
          {
            const bool has_space = not_full_.wait_for(lock, block_timeout_, [&]() {
              return closed_ || blocks_.size() < capacity_;
            });
            if (closed_) {
              return false;
            }
            if (!has_space) {
              ++dropped_;
              return false;
            }
          }
          break;
      }
    }

    blocks_.push_back(move(block));
  }
  not_empty_.notify_one();
  return true;
}

bool SampleQueue::pop(RawBlock & out, chrono::milliseconds timeout)
{
  {
    unique_lock<mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [&]() {
      return !blocks_.empty() || closed_;
    });
    if (blocks_.empty()) {
      return false;
    }
    out = move(blocks_.front());
    blocks_.pop_front();
  }
  not_full_.notify_one();
  return true;
}

void SampleQueue::close()
{
  {
    lock_guard<mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

void SampleQueue::reopen()
{
  lock_guard<mutex> lock(mutex_);
  closed_ = false;
}

void SampleQueue::clear()
{
  {
    lock_guard<mutex> lock(mutex_);
    blocks_.clear();
  }
  not_full_.notify_all();
}

bool SampleQueue::closed() const
{
  lock_guard<mutex> lock(mutex_);
  return closed_;
}

size_t SampleQueue::size() const
{
  lock_guard<mutex> lock(mutex_);
  return blocks_.size();
}

uint64_t SampleQueue::dropped_blocks() const
{
  lock_guard<mutex> lock(mutex_);
  return dropped_;
}

}  // namespace speech_segmenter_cpp
