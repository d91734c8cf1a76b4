#pragma once
#include <cstddef>
#include <iostream>

#include "playbook/render.hpp"
#include "playbook/step.hpp"


namespace playbook {


// Drives one step through prepare -> execute -> cleanup.
//
//   Continue  cleanup() runs and run() returns.
//   Retry     a notice is printed and the same instance starts over at prepare().
//   Halt      a notice is printed and the process exits with status 1.
//             cleanup() is NOT called on this path. Any value outside the
//             enumeration is treated the same way.
class Runner {
public:
  explicit Runner(std::ostream& out=std::cout, std::size_t wrap_width=70)
    : out_(out), renderer_(out, wrap_width) {}

  void run(Step& step);

  std::ostream& out() { return out_; }

private:
  [[noreturn]] void halt(const Step& step);

  std::ostream& out_;
  Renderer renderer_;
};


} // namespace playbook
