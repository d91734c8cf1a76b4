#include "playbook/config.hpp"
#include "playbook/utils.hpp"

#include <cstdlib>

namespace playbook {

Config Config::from_environment(){
  Config c;
  if(auto home = home_dir()) c.history_path = *home + "/.playbook_history";
  if(const char* h = std::getenv("PLAYBOOK_HISTORY")) c.history_path = expand_home(h);
  if(const char* p = std::getenv("PLAYBOOK_PATH")){
    for(auto& chunk : split_paths(p)) c.plugin_paths.push_back(expand_home(chunk));
  }
  return c;
}

} // namespace playbook
