// A playbook library: build it as a shared module and run it with
//   playbook -L path/to/release_checklist.so release.Checklist

#include "playbook/registry.hpp"
#include "playbook/serial.hpp"
#include "playbook/tasks.hpp"
#include "playbook/utils.hpp"

#include <iostream>
#include <memory>

namespace {

struct ChooseArtifact : playbook::PathPrompt {
  std::ostream& out;

  ChooseArtifact(playbook::LineEditor& editor, std::ostream& o)
    : PathPrompt(editor, "ChooseArtifact",
                 "Enter the path of the release tarball.\n\n"
                 "Use TAB to complete file names.",
                 "artifact: "),
      out(o) {}

protected:
  playbook::Transition accept_path(const std::string& path) override {
    if(!playbook::ends_with(path, ".tar.gz")){
      out << path << " is not a .tar.gz archive\n";
      return playbook::Transition::Retry;
    }
    out << "using " << path << "\n";
    return playbook::Transition::Continue;
  }
};

} // namespace

extern "C" void playbook_register(playbook::Registry& registry){
  registry.add("release.ChooseArtifact", [](playbook::Session& s) -> playbook::StepPtr {
    return std::make_shared<ChooseArtifact>(s.editor, s.runner.out());
  });

  registry.add("release.Checklist", [](playbook::Session& s) -> playbook::StepPtr {
    return playbook::make_serial(s.runner, "Checklist",
      "Cut a release.\n\nEach step waits for you before moving on.",
      {
        std::make_shared<playbook::Confirm>(s.editor, "Tag the release commit and push the tag."),
        std::make_shared<ChooseArtifact>(s.editor, s.runner.out()),
        std::make_shared<playbook::Confirm>(s.editor, "Upload the artifact and announce the release."),
      });
  });
}
