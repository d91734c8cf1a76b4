#pragma once
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>


namespace playbook {


// (typed_prefix, candidate_index) -> candidate. Called with index 0, 1, 2, ...
// until it returns nothing.
using CompletionHook = std::function<std::optional<std::string>(const std::string&, int)>;


// The operator's input channel. At most one completion hook is installed at a
// time; installing replaces the previous one.
class LineEditor {
public:
  virtual ~LineEditor() = default;

  // Blocks for one line. No value means the input channel was closed.
  virtual std::optional<std::string> read_line(const std::string& prompt) = 0;

  void set_completion(CompletionHook hook) { hook_ = std::move(hook); }
  void clear_completion() { hook_ = nullptr; }
  bool has_completion() const { return static_cast<bool>(hook_); }

  std::optional<std::string> complete(const std::string& prefix, int index) const;
  // every candidate the hook offers for `prefix`, in order
  std::vector<std::string> candidates(const std::string& prefix) const;

private:
  CompletionHook hook_;
};


// Reads from a plain stream. Used when stdin is not a terminal.
class StreamEditor : public LineEditor {
public:
  explicit StreamEditor(std::istream& in=std::cin, std::ostream& out=std::cout): in_(in), out_(out) {}
  std::optional<std::string> read_line(const std::string& prompt) override;

private:
  std::istream& in_;
  std::ostream& out_;
};


// GNU readline with tab completion and a persistent history file.
//
// readline is process-wide state, so only one instance may exist at a time.
// History is saved when the editor is destroyed and, through an atexit
// handler, when the process exits while the editor is still alive.
class ReadlineEditor : public LineEditor {
public:
  // empty history_path disables the history file
  ReadlineEditor(std::string history_path, int max_entries);
  ~ReadlineEditor() override;

  ReadlineEditor(const ReadlineEditor&) = delete;
  ReadlineEditor& operator=(const ReadlineEditor&) = delete;

  std::optional<std::string> read_line(const std::string& prompt) override;

  bool save_history();

private:
  std::string history_path_;
};


} // namespace playbook
