#include "framewatch/cli/router.hpp"

int main(int argc, char** argv) {
  return framewatch::cli::Dispatch(argc, argv);
}
