#pragma once
#include "../io/config_types.hpp"
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace psychro::core {

class ConfigurationLoader {
public:
  struct LoadResult {
    io::Configuration config;
    std::filesystem::path config_file;
  };

  // Load and validate the YAML case file
  [[nodiscard]] auto load_configuration(const std::string& config_file) -> std::expected<LoadResult, ApplicationError>;

  // Display configuration information
  auto display_configuration_info(const io::Configuration& config) const -> void;

private:
  // Display solver settings
  auto display_solver_info(const io::SolverSettings& solver) const -> void;

  // Display the list of cases
  auto display_cases(const io::Configuration& config) const -> void;
};

} // namespace psychro::core
