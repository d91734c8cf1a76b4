#include "playbook/cli.hpp"

int main(int argc, char** argv){
  return playbook::run_cli(argc, argv);
}
