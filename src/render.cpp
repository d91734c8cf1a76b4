#include "playbook/render.hpp"

#include <sstream>

namespace playbook {

std::vector<std::string> wrap(const std::string& paragraph, std::size_t width){
  std::vector<std::string> lines;
  std::istringstream iss(paragraph);
  std::string word, cur;
  while(iss >> word){
    if(cur.empty()) cur = word;
    else if(cur.size() + 1 + word.size() <= width) { cur += ' '; cur += word; }
    else { lines.push_back(cur); cur = word; }
  }
  if(!cur.empty()) lines.push_back(cur);
  return lines;
}

void Renderer::render(const std::string& text) const {
  if(text.empty()) return;

  out << "\n";
  size_t start = 0;
  while(true){
    size_t sep = text.find("\n\n", start);
    std::string para = (sep==std::string::npos) ? text.substr(start) : text.substr(start, sep-start);
    for(const auto& line : wrap(para, width)) out << line << "\n";
    out << "\n";
    if(sep==std::string::npos) break;
    start = sep + 2;
  }
  out.flush();
}

} // namespace playbook
