#pragma once
#include <stdexcept>
#include <utility>
#include <string>

namespace playbook {

// Base for fatal conditions that are not step outcomes.
struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A path typed by the operator does not exist.
struct MissingPathError : Error {
  std::string step;
  std::string path;
  MissingPathError(std::string s, std::string p)
    : Error(s + ": no such file or directory: " + p), step(std::move(s)), path(std::move(p)) {}
};

// A playbook library could not be loaded.
struct PluginError : Error {
  std::string library;
  PluginError(std::string lib, const std::string& why)
    : Error("cannot load " + lib + ": " + why), library(std::move(lib)) {}
};

} // namespace playbook
