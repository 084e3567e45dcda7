#include "psychro/core/configuration_loader.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/io/config_manager.hpp"
#include <format>
#include <iomanip>
#include <iostream>

namespace psychro::core {

auto ConfigurationLoader::load_configuration(const std::string& config_file)
    -> std::expected<LoadResult, ApplicationError> {

  io::ConfigurationManager config_manager;
  auto config_result = config_manager.load(config_file);

  if (!config_result) {
    return std::unexpected(ApplicationError{"Failed to load config: " + config_result.error().message(),
                                            constants::application::exit_failure});
  }

  std::cout << "✓ Configuration loaded successfully (" << config_result->cases.size() << " case(s))" << std::endl;

  display_configuration_info(config_result.value());

  return LoadResult{std::move(config_result.value()), config_manager.config_file_path()};
}

auto ConfigurationLoader::display_configuration_info(const io::Configuration& config) const -> void {
  display_solver_info(config.solver);
  display_cases(config);
}

auto ConfigurationLoader::display_solver_info(const io::SolverSettings& solver) const -> void {
  using namespace constants::string_processing;

  std::cout << "\n" << colors::cyan << "┌─ SOLVER SETUP ────────────────────────────┐" << colors::reset << std::endl;
  std::cout << "│ Tolerance       : " << std::setw(20) << std::left << solver.tolerance << " │" << std::endl;
  std::cout << "│ Max iterations  : " << std::setw(20) << std::left << solver.max_iterations << " │" << std::endl;
  std::cout << "│ Strict converge : " << std::setw(20) << std::left << (solver.strict_convergence ? "Yes" : "No")
            << " │" << std::endl;
  std::cout << colors::cyan << "└───────────────────────────────────────────┘" << colors::reset << std::right
            << std::endl;
}

auto ConfigurationLoader::display_cases(const io::Configuration& config) const -> void {
  if (config.cases.empty()) {
    std::cout << "\nNo process cases configured" << std::endl;
    return;
  }

  std::cout << "\nProcess cases:" << std::endl;
  for (std::size_t i = 0; i < config.cases.size(); ++i) {
    const auto& case_config = config.cases[i];
    std::cout << std::format("  [{:2}] {:<24} {}", i, case_config.name, io::to_string(case_config.type)) << std::endl;
  }
}

} // namespace psychro::core
