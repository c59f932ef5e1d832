#include "flowexec/cli/router.hpp"

int main(int argc, char** argv) {
  return flowexec::cli::Dispatch(argc, argv);
}
