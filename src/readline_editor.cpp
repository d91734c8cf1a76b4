#include "playbook/line_editor.hpp"
#include "playbook/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>

extern "C" {
#include <readline/history.h>
#include <readline/readline.h>
}

namespace fs = std::filesystem;

namespace playbook {

// ---------------- readline glue ----------------
namespace {
  ReadlineEditor* g_active = nullptr;
  bool g_atexit_registered = false;
  int g_candidate_index = 0;

  // readline hands us the whole line (no word breaks); state==0 starts a new round
  char* completion_generator(const char* text, int state){
    if(!g_active) return nullptr;
    if(state == 0) g_candidate_index = 0;
    auto c = g_active->complete(text, g_candidate_index++);
    if(!c) return nullptr;
    return strdup(c->c_str()); // readline frees it
  }

  char** attempted_completion(const char* text, int /*start*/, int /*end*/){
    rl_attempted_completion_over = 1;   // never fall back to filename completion
    rl_completion_append_character = '\0';
    return rl_completion_matches(text, completion_generator);
  }

  void save_history_at_exit(){
    if(g_active) (void)g_active->save_history();
  }

  bool same_as_last_entry(const char* line){
    if(history_length <= 0) return false;
    HIST_ENTRY* last = history_get(history_base + history_length - 1);
    return last && last->line && std::strcmp(last->line, line) == 0;
  }
}

// ---------------- ReadlineEditor ----------------
ReadlineEditor::ReadlineEditor(std::string history_path, int max_entries)
  : history_path_(std::move(history_path)) {
  if(g_active) PLAYBOOK_LOG_WARN("replacing an active readline editor");
  g_active = this;

  rl_readline_name = "playbook";
  rl_completer_word_break_characters = "";
  rl_attempted_completion_function = attempted_completion;

  using_history();
  if(max_entries > 0) stifle_history(max_entries);

  if(!history_path_.empty()){
    std::error_code ec;
    if(fs::exists(history_path_, ec)){
      int rc = read_history(history_path_.c_str());
      if(rc != 0) PLAYBOOK_LOG_WARN("cannot read history " + history_path_ + ": " + std::strerror(rc));
    }
  }

  if(!g_atexit_registered){
    std::atexit(save_history_at_exit);
    g_atexit_registered = true;
  }
}

ReadlineEditor::~ReadlineEditor(){
  (void)save_history();
  if(g_active == this) g_active = nullptr;
  rl_attempted_completion_function = nullptr;
}

std::optional<std::string> ReadlineEditor::read_line(const std::string& prompt){
  char* in = readline(prompt.c_str());
  if(!in) return std::nullopt;
  std::string line(in);
  if(!line.empty() && !same_as_last_entry(in)) add_history(in);
  free(in);
  return line;
}

bool ReadlineEditor::save_history(){
  if(history_path_.empty()) return true;
  int rc = write_history(history_path_.c_str());
  if(rc != 0){
    PLAYBOOK_LOG_WARN("cannot save history " + history_path_ + ": " + std::strerror(rc));
    return false;
  }
  return true;
}

} // namespace playbook
