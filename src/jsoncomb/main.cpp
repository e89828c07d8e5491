#include "jsoncomb/cli/router.hpp"

int main(int argc, char** argv) {
  return jsoncomb::cli::Dispatch(argc, argv);
}
