#include "playbook/tasks.hpp"
#include "playbook/errors.hpp"
#include "playbook/log.hpp"
#include "playbook/utils.hpp"

#include <filesystem>
#include <system_error>

#include <glob.h>

namespace fs = std::filesystem;

namespace playbook {

/* ---------------- Confirm ---------------- */

void Confirm::prepare(){
  editor().set_completion(&Confirm::complete);
}

void Confirm::cleanup(){
  editor().clear_completion();
}

std::optional<std::string> Confirm::complete(const std::string& prefix, int index){
  static const char* const choices[] = {"y", "n"};

  std::vector<std::string> matches;
  for(const char* c : choices){
    if(prefix == c) { matches.assign(1, std::string(c)); break; }
    if(starts_with(c, prefix)) matches.emplace_back(c);
  }
  if(index < 0 || index >= (int)matches.size()) return std::nullopt;
  return matches[index];
}

Transition Confirm::accept(const std::string& response){
  if(response == "y") return Transition::Continue;
  if(response == "n") return Transition::Halt;
  return Transition::Retry;
}

/* ---------------- PathPrompt ---------------- */

std::vector<std::string> glob_completions(const std::string& prefix){
  std::string pattern = expand_home(prefix) + "*";
  bool tilde = !prefix.empty() && prefix[0] == '~' && pattern[0] != '~';

  std::vector<std::string> out;
  glob_t g{};
  int rc = glob(pattern.c_str(), GLOB_MARK, nullptr, &g);
  if(rc == 0){
    for(size_t i=0; i<g.gl_pathc; ++i){
      std::string p = g.gl_pathv[i];
      out.push_back(tilde ? contract_home(p) : p);
    }
  } else if(rc != GLOB_NOMATCH){
    PLAYBOOK_LOG_DEBUG("glob failed for " + pattern);
  }
  globfree(&g);
  return out;
}

void PathPrompt::prepare(){
  cached_prefix_.reset();
  cached_matches_.clear();
  editor().set_completion([this](const std::string& prefix, int index){ return complete(prefix, index); });
}

void PathPrompt::cleanup(){
  editor().clear_completion();
  cached_prefix_.reset();
  cached_matches_.clear();
}

std::optional<std::string> PathPrompt::complete(const std::string& prefix, int index){
  if(!cached_prefix_ || *cached_prefix_ != prefix){
    cached_matches_ = glob_completions(prefix);
    cached_prefix_ = prefix;
  }
  if(index < 0 || index >= (int)cached_matches_.size()) return std::nullopt;
  return cached_matches_[index];
}

Transition PathPrompt::accept(const std::string& response){
  std::string path = expand_home(response);
  std::error_code ec;
  if(path.empty() || !fs::exists(path, ec)) throw MissingPathError(name(), path);
  return accept_path(path);
}

} // namespace playbook
