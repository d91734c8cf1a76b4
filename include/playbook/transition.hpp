#pragma once
#include <string>


namespace playbook {


// Outcome of Step::execute(). Anything outside these three is handled as Halt.
enum class Transition { Continue, Retry, Halt };


std::string to_string(Transition t);


} // namespace playbook
