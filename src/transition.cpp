#include "playbook/transition.hpp"

namespace playbook {

std::string to_string(Transition t){
  switch(t){
    case Transition::Continue: return "continue";
    case Transition::Retry:    return "retry";
    case Transition::Halt:     return "halt";
  }
  return "unknown(" + std::to_string(static_cast<int>(t)) + ")";
}

} // namespace playbook
