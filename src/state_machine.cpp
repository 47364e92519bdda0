#include "speech_segmenter_cpp/state_machine.hpp"

using namespace std;


namespace speech_segmenter_cpp
{

StateMachine::StateMachine()
: state_(ActivityState::IDLE)
{
}

ActivityState StateMachine::state() const
{
  return state_;
}

string StateMachine::to_string(ActivityState state)
{
  switch (state) {
    case ActivityState::IDLE:
      return "idle";
    case ActivityState::SPEAKING:
      return "speaking";
    default:
      return "unknown";
  }
}

string StateMachine::state_string() const
{
  return to_string(state_);
}

void StateMachine::set_state(ActivityState next)
{
  state_ = next;
}

void StateMachine::reset()
{
  state_ = ActivityState::IDLE;
}

}  // namespace speech_segmenter_cpp
