#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace playbook {

struct Config {
  std::string history_path;             // empty: no history file
  int history_length{256};
  std::size_t wrap_width{70};
  std::vector<std::string> plugin_paths; // shared libraries or directories
  bool verbose{false};

  // Defaults plus HOME, PLAYBOOK_HISTORY and PLAYBOOK_PATH.
  static Config from_environment();
};

} // namespace playbook
