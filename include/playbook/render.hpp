#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace playbook {

// Greedy word wrap; words wider than `width` get a line of their own.
std::vector<std::string> wrap(const std::string& paragraph, std::size_t width);

// Prints step descriptions: paragraphs separated by blank lines, each wrapped.
struct Renderer {
  std::ostream& out;
  std::size_t width{70};

  explicit Renderer(std::ostream& o, std::size_t w=70): out(o), width(w) {}
  void render(const std::string& text) const;
};

} // namespace playbook
