#pragma once
#include <memory>
#include <string>

#include "playbook/transition.hpp"


namespace playbook {


// A single unit of guided operator work.
//
// The Runner calls prepare() before every execute() attempt, including
// retries, and cleanup() only after execute() returned Continue. prepare()
// must therefore tolerate being called again without a cleanup() in between.
class Step {
public:
  Step(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}
  virtual ~Step() = default;

  // used in Runner notices ("re-trying <name>...")
  const std::string& name() const { return name_; }
  // shown to the operator before each attempt; may be empty
  const std::string& description() const { return description_; }

  virtual void prepare() {}
  virtual Transition execute() = 0;
  virtual void cleanup() {}

private:
  std::string name_;
  std::string description_;
};

using StepPtr = std::shared_ptr<Step>;


} // namespace playbook
