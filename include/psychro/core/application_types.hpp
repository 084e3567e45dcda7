#pragma once
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace psychro::core {

// Application-level error handling
struct ApplicationError {
  std::string message;
  int exit_code;
};

// Command line arguments structure
struct CommandLineArgs {
  std::string config_file;
  std::string output_name;
  bool help_requested = false;
};

// Application result for clean exit handling
struct ApplicationResult {
  bool success;
  int exit_code;
  std::string message;
};

// Performance metrics for reporting
struct PerformanceMetrics {
  std::chrono::milliseconds total_time{0};
  std::chrono::milliseconds calculation_time{0};
  std::chrono::milliseconds chart_time{0};
  std::chrono::milliseconds output_time{0};
  std::size_t cases_run = 0;
  std::vector<std::filesystem::path> output_files;
};

} // namespace psychro::core
