#pragma once
#include <iostream>

namespace playbook {

// The `playbook` command line. Returns the process exit status:
// 0 on completion, 1 for an unknown playbook or a fatal error, 2 for bad usage.
// A halting step still ends the process from inside the Runner.
//
// GNU readline is used only when `in` is std::cin and stdin is a terminal.
int run_cli(int argc, char** argv,
            std::istream& in=std::cin, std::ostream& out=std::cout, std::ostream& err=std::cerr);

} // namespace playbook
