#include "fleetcap/cli/router.hpp"

int main(int argc, char** argv) {
  return fleetcap::cli::Dispatch(argc, argv);
}
