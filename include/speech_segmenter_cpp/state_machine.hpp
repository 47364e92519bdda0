#pragma once

#include <string>

namespace speech_segmenter_cpp
{

enum class ActivityState
{
  IDLE,
  SPEAKING
};

class StateMachine
{
public:
  StateMachine();

  ActivityState state() const;
  std::string state_string() const;
  void set_state(ActivityState next);
  void reset();

  static std::string to_string(ActivityState state);

private:
  ActivityState state_;
};

}  // namespace speech_segmenter_cpp
