#include "cli/cli.hpp"

int main(int argc, char* argv[]) {
  return sft::cli::run(argc, argv);
}
