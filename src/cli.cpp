#include "playbook/cli.hpp"
#include "playbook/config.hpp"
#include "playbook/errors.hpp"
#include "playbook/line_editor.hpp"
#include "playbook/log.hpp"
#include "playbook/registry.hpp"
#include "playbook/runner.hpp"

#include <getopt.h>
#include <unistd.h>

#include <memory>
#include <string>

namespace playbook {

static void usage(std::ostream& os){
  os << "usage: playbook [-v] [-L LOADPATH]... [--list] PLAYBOOK\n"
        "\n"
        "Playbooks for semi-automated repetitive tasks.\n"
        "\n"
        "  -L, --load LOADPATH  load playbooks from a shared library or a directory of them\n"
        "      --list           print the registered playbooks and exit\n"
        "  -v, --verbose        log step lifecycle to stderr\n"
        "  -h, --help           show this help\n";
}

int run_cli(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err){
  Config cfg = Config::from_environment();
  bool list = false;

  static struct option long_options[] = {{"load", required_argument, 0, 'L'},
                                         {"list", no_argument, 0, 'l'},
                                         {"verbose", no_argument, 0, 'v'},
                                         {"help", no_argument, 0, 'h'},
                                         {0, 0, 0, 0}};
  optind = 0; // full rescan, run_cli may be called more than once
  int opt, option_index = 0;
  while((opt = getopt_long(argc, argv, "L:vh", long_options, &option_index)) != -1){
    switch(opt){
      case 'L': cfg.plugin_paths.push_back(optarg); break;
      case 'l': list = true; break;
      case 'v': cfg.verbose = true; break;
      case 'h': usage(out); return 0;
      default:  usage(err); return 2;
    }
  }
  Logger::instance().set_verbose(cfg.verbose);

  Registry registry;
  register_builtin_playbooks(registry);
  try {
    load_plugins(cfg.plugin_paths, registry);
  } catch(const Error& e){
    err << "error: " << e.what() << "\n";
    return 1;
  }

  if(list){
    for(const auto& name : registry.names()) out << name << "\n";
    return 0;
  }
  if(optind >= argc){ usage(err); return 2; }
  std::string id = argv[optind];

  std::unique_ptr<LineEditor> editor;
  if(&in == &std::cin && isatty(STDIN_FILENO)) editor = std::make_unique<ReadlineEditor>(cfg.history_path, cfg.history_length);
  else                                         editor = std::make_unique<StreamEditor>(in, out);

  Runner runner(out, cfg.wrap_width);
  Session session{runner, *editor};

  auto step = registry.create(id, session);
  if(!step){
    out << "The identifier " << id << " doesn't name a playbook.\n";
    out << "Cannot continue; exiting.\n";
    return 1;
  }

  try {
    runner.run(*step);
  } catch(const Error& e){
    err << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

} // namespace playbook
