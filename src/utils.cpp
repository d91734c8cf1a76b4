#include "playbook/utils.hpp"
#include <cstdlib>


namespace playbook {


bool starts_with(const std::string& s, const std::string& p){
return s.rfind(p,0)==0;
}


bool ends_with(const std::string& s, const std::string& suffix){
return s.size()>=suffix.size() && s.compare(s.size()-suffix.size(), suffix.size(), suffix)==0;
}


std::vector<std::string> split_paths(const std::string& s, char sep){
std::vector<std::string> out; size_t start=0;
while(true){
  size_t pos = s.find(sep, start);
  std::string chunk = (pos==std::string::npos) ? s.substr(start) : s.substr(start, pos-start);
  if(!chunk.empty()) out.push_back(chunk);
  if(pos==std::string::npos) break;
  start = pos+1;
}
return out;
}


std::optional<std::string> home_dir(){
const char* home = std::getenv("HOME");
if(!home || !*home) return std::nullopt;
return std::string(home);
}


std::string expand_home(const std::string& path){
if(path.empty() || path[0]!='~') return path;
if(path.size()>1 && path[1]!='/') return path; // ~user is not supported
auto home = home_dir();
if(!home) return path;
return *home + path.substr(1);
}


std::string contract_home(const std::string& path){
auto home = home_dir();
if(!home) return path;
if(path == *home) return "~";
if(starts_with(path, *home + "/")) return "~" + path.substr(home->size());
return path;
}


} // namespace playbook
