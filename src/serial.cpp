#include "playbook/serial.hpp"

#include <memory>

namespace playbook {

Transition SerialComposite::execute(){
  for(const auto& step : steps_){
    if(step) runner_.run(*step);
  }
  return Transition::Continue;
}

StepPtr make_serial(Runner& runner, std::string name, std::string description, std::vector<StepPtr> steps){
  return std::make_shared<SerialComposite>(runner, std::move(name), std::move(description), std::move(steps));
}

} // namespace playbook
