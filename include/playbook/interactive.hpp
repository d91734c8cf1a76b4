#pragma once
#include <string>

#include "playbook/line_editor.hpp"
#include "playbook/step.hpp"


namespace playbook {


// A step that blocks for one line of operator input and hands it to accept().
// End of input halts without calling accept().
//
// Subclasses that offer tab completion install their hook in prepare() and
// remove it in cleanup(); the Runner does not do this for them.
class InteractiveStep : public Step {
public:
  InteractiveStep(LineEditor& editor, std::string name, std::string description, std::string prompt="> ")
    : Step(std::move(name), std::move(description)), editor_(editor), prompt_(std::move(prompt)) {}

  Transition execute() override;

  const std::string& prompt() const { return prompt_; }
  void set_prompt(std::string p) { prompt_ = std::move(p); }

protected:
  virtual Transition accept(const std::string& response) = 0;

  LineEditor& editor() { return editor_; }

private:
  LineEditor& editor_;
  std::string prompt_;
};


} // namespace playbook
