#include "playbook/interactive.hpp"

namespace playbook {

Transition InteractiveStep::execute(){
  auto response = editor_.read_line(prompt_);
  if(!response) return Transition::Halt;
  return accept(*response);
}

} // namespace playbook
