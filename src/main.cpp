#include "psychro/core/application_runner.hpp"

int main(int argc, char* argv[]) {
  psychro::core::ApplicationRunner runner;
  auto result = runner.run(argc, argv);
  return result.exit_code;
}
