#include "playbook/registry.hpp"
#include "playbook/errors.hpp"
#include "playbook/log.hpp"
#include "playbook/tasks.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <system_error>

#include <dlfcn.h>

namespace fs = std::filesystem;

namespace playbook {

/* ---------------- Registry ---------------- */

void Registry::add(const std::string& name, Factory factory){
  if(factories_.count(name)) PLAYBOOK_LOG_DEBUG("replacing playbook " + name);
  factories_[name] = std::move(factory);
}

bool Registry::has(const std::string& name) const {
  return factories_.find(name) != factories_.end();
}

StepPtr Registry::create(const std::string& name, Session& session) const {
  auto it = factories_.find(name);
  if(it == factories_.end()) return nullptr;
  return it->second(session);
}

std::vector<std::string> Registry::names() const {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for(const auto& kv : factories_) out.push_back(kv.first);
  return out;
}

void register_builtin_playbooks(Registry& registry){
  registry.add("tasks.Confirm", [](Session& s) -> StepPtr {
    return std::make_shared<Confirm>(s.editor);
  });
}

/* ---------------- plugin loading ---------------- */

void load_plugin(const std::string& library, Registry& registry){
  // RTLD_NODELETE: factories and steps built from this library outlive us
  void* handle = dlopen(library.c_str(), RTLD_NOW | RTLD_LOCAL | RTLD_NODELETE);
  if(!handle){
    const char* err = dlerror();
    throw PluginError(library, err ? err : "dlopen failed");
  }

  dlerror();
  void* sym = dlsym(handle, kRegisterSymbol);
  const char* err = dlerror();
  if(err || !sym){
    std::string why = err ? err : std::string("missing ") + kRegisterSymbol;
    dlclose(handle);
    throw PluginError(library, why);
  }

  PLAYBOOK_LOG_DEBUG("loading playbooks from " + library);
  reinterpret_cast<RegisterFn>(sym)(registry);
}

void load_plugins(const std::vector<std::string>& paths, Registry& registry){
  for(const auto& path : paths){
    std::error_code ec;
    if(fs::is_directory(path, ec)){
      std::vector<fs::path> libs;
      for(auto it = fs::directory_iterator(path, ec); !ec && it != fs::end(it); it.increment(ec)){
        if(it->is_regular_file(ec) && it->path().extension() == ".so") libs.push_back(it->path());
      }
      std::sort(libs.begin(), libs.end());
      for(const auto& lib : libs) load_plugin(lib.string(), registry);
      continue;
    }
    if(!fs::exists(path, ec)){
      PLAYBOOK_LOG_WARN("playbook path not found: " + path);
      continue;
    }
    load_plugin(path, registry);
  }
}

} // namespace playbook
