#include "playbook/line_editor.hpp"

namespace playbook {

std::optional<std::string> LineEditor::complete(const std::string& prefix, int index) const {
  if(!hook_) return std::nullopt;
  return hook_(prefix, index);
}

std::vector<std::string> LineEditor::candidates(const std::string& prefix) const {
  std::vector<std::string> out;
  for(int i=0; auto c = complete(prefix, i); ++i) out.push_back(*c);
  return out;
}

std::optional<std::string> StreamEditor::read_line(const std::string& prompt){
  out_ << prompt << std::flush;
  std::string line;
  if(!std::getline(in_, line)){
    out_ << "\n";
    return std::nullopt;
  }
  return line;
}

} // namespace playbook
