#include "playbook/runner.hpp"
#include "playbook/log.hpp"

#include <cstdlib>

namespace playbook {

void Runner::run(Step& step){
  while(true){
    PLAYBOOK_LOG_DEBUG("prepare " + step.name());
    step.prepare();
    renderer_.render(step.description());

    Transition t = step.execute();
    PLAYBOOK_LOG_DEBUG(step.name() + " returned " + to_string(t));

    switch(t){
      case Transition::Continue:
        PLAYBOOK_LOG_DEBUG("cleanup " + step.name());
        step.cleanup();
        return;
      case Transition::Retry:
        out_ << "re-trying " << step.name() << "...\n";
        continue;
      case Transition::Halt:
        break;
    }
    // Halt, or a value outside the enumeration
    halt(step);
  }
}

void Runner::halt(const Step& step){
  out_ << "cannot continue after " << step.name() << "; exiting\n";
  out_.flush();
  std::exit(1);
}

} // namespace playbook
