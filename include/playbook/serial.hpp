#pragma once
#include <string>
#include <vector>

#include "playbook/runner.hpp"
#include "playbook/step.hpp"

namespace playbook {

// Runs its children in order, each with its own full lifecycle via the
// Runner. A halting child ends the process, so execute() only ever returns
// Continue. The composite's own prepare()/cleanup() do nothing.
class SerialComposite : public Step {
public:
  SerialComposite(Runner& runner, std::string name, std::string description, std::vector<StepPtr> steps)
    : Step(std::move(name), std::move(description)), runner_(runner), steps_(std::move(steps)) {}

  Transition execute() override;

  const std::vector<StepPtr>& steps() const { return steps_; }

private:
  Runner& runner_;
  const std::vector<StepPtr> steps_;
};

StepPtr make_serial(Runner& runner, std::string name, std::string description, std::vector<StepPtr> steps);

} // namespace playbook
