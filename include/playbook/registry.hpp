#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "playbook/line_editor.hpp"
#include "playbook/runner.hpp"
#include "playbook/step.hpp"


namespace playbook {


// What a playbook factory gets to build its steps with.
struct Session {
  Runner& runner;
  LineEditor& editor;
};

using Factory = std::function<StepPtr(Session&)>;


// Maps dotted identifiers ("tasks.Confirm") to playbook factories.
class Registry {
public:
  // replaces any factory already registered under `name`
  void add(const std::string& name, Factory factory);
  bool has(const std::string& name) const;
  // nullptr when nothing is registered under `name`
  StepPtr create(const std::string& name, Session& session) const;
  std::vector<std::string> names() const;

private:
  std::map<std::string, Factory> factories_;
};


void register_builtin_playbooks(Registry& registry);


// Entry point every playbook library exports.
using RegisterFn = void (*)(Registry&);
constexpr const char* kRegisterSymbol = "playbook_register";

// dlopen() `library` and call its playbook_register(). Throws PluginError.
void load_plugin(const std::string& library, Registry& registry);

// Files are loaded as libraries; directories contribute every "*.so" entry,
// in name order. Missing paths are skipped with a warning.
void load_plugins(const std::vector<std::string>& paths, Registry& registry);


} // namespace playbook
