#pragma once
#include <optional>
#include <string>
#include <vector>

#include "playbook/interactive.hpp"


namespace playbook {


// "y" continues, "n" halts, anything else asks again.
class Confirm : public InteractiveStep {
public:
  explicit Confirm(LineEditor& editor,
                   std::string description="Pausing until you wish to continue.",
                   std::string name="Confirm")
    : InteractiveStep(editor, std::move(name), std::move(description), "continue? (y|n) ") {}

  void prepare() override;
  void cleanup() override;

  static std::optional<std::string> complete(const std::string& prefix, int index);

protected:
  Transition accept(const std::string& response) override;
};


// Asks for a filesystem path. "~" is expanded and the path must exist;
// otherwise MissingPathError is thrown before accept_path() runs.
// Tab completion globs the typed text.
class PathPrompt : public InteractiveStep {
public:
  PathPrompt(LineEditor& editor, std::string name, std::string description, std::string prompt="path: ")
    : InteractiveStep(editor, std::move(name), std::move(description), std::move(prompt)) {}

  void prepare() override;
  void cleanup() override;

  std::optional<std::string> complete(const std::string& prefix, int index);

protected:
  Transition accept(const std::string& response) override;
  virtual Transition accept_path(const std::string& path) = 0;

private:
  // matches for cached_prefix_; recomputed when the typed text changes
  std::optional<std::string> cached_prefix_;
  std::vector<std::string> cached_matches_;
};


// "<pattern>*" expanded through glob(3); directories carry a trailing '/'.
// A leading "~" in the pattern is expanded and put back in the results.
std::vector<std::string> glob_completions(const std::string& prefix);


} // namespace playbook
