#include "camfeed/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing and exit-code contracts live in the CLI router.
  return camfeed::cli::Dispatch(argc, argv);
}
