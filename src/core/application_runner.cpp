#include "psychro/core/application_runner.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/io/output/hdf5_writer.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

namespace psychro::core {

ApplicationRunner::ApplicationRunner()
    : config_loader_(std::make_unique<ConfigurationLoader>()), output_manager_(std::make_unique<OutputManager>()),
      case_runner_(std::make_unique<CaseRunner>()) {}

ApplicationRunner::~ApplicationRunner() = default;

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  auto start_time = std::chrono::high_resolution_clock::now();
  PerformanceMetrics metrics;

  try {
    // Parse command line arguments
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      display_usage(argc > 0 ? argv[0] : "psychro_app");
      return handle_error(args_result.error());
    }
    auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[0]);
      return {true, constants::application::exit_success, "Help displayed"};
    }

    display_header();

    // Load configuration
    auto config_result = config_loader_->load_configuration(args.config_file);
    if (!config_result) {
      return handle_error(config_result.error());
    }
    auto [config, config_file] = std::move(config_result.value());

    // Initialize output system
    if (auto output_init = output_manager_->initialize_output_system(config, args.output_name); !output_init) {
      return handle_error(output_init.error());
    }

    // Run process cases
    auto records_result = case_runner_->run_cases(config, metrics);
    if (!records_result) {
      return handle_error(records_result.error());
    }
    auto records = std::move(records_result.value());

    if (!records.empty()) {
      auto output_result = output_manager_->write_case_results(records, config, config_file, metrics);
      if (!output_result) {
        return handle_error(output_result.error());
      }
    }

    // Psychrometric chart
    if (config.chart.enabled) {
      auto chart_result = case_runner_->run_chart(config, metrics);
      if (!chart_result) {
        return handle_error(chart_result.error());
      }
      auto chart_file = output_manager_->write_chart(config.chart, chart_result.value(), metrics);
      if (!chart_file) {
        return handle_error(chart_file.error());
      }
    }

    // Calculate total time
    auto end_time = std::chrono::high_resolution_clock::now();
    metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    // Display results and performance
    case_runner_->display_case_results(records, config.verbose);
    output_manager_->display_output_files(metrics);
    display_performance_summary(metrics);
    display_completion_message();

    cleanup();

    return {true, constants::application::exit_success, "Success"};

  } catch (const std::exception& e) {
    cleanup();
    return handle_error(
        ApplicationError{"Unexpected error: " + std::string(e.what()), constants::application::exit_failure});
  }
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[]) -> std::expected<CommandLineArgs, ApplicationError> {

  if (argc < constants::application::min_required_args) {
    return std::unexpected(ApplicationError{"Insufficient arguments provided", constants::application::exit_failure});
  }

  CommandLineArgs args;

  const std::string_view first_arg = argv[constants::application::config_file_arg_index];
  if (first_arg == "-h" || first_arg == "--help") {
    args.help_requested = true;
    return args;
  }

  args.config_file = std::string(first_arg);

  if (argc > constants::application::output_name_arg_index) {
    args.output_name = argv[constants::application::output_name_arg_index];
  }

  return args;
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " <config_file.yaml> [output_name]\n";
}

auto ApplicationRunner::display_header() const -> void {
  std::cout << "=== psychro Humid Air Process Calculator ===" << std::endl;
}

auto ApplicationRunner::display_performance_summary(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
  std::cout << "Cases run: " << metrics.cases_run << std::endl;
  std::cout << "Calculation time: " << metrics.calculation_time.count() << " ms" << std::endl;
  if (metrics.chart_time.count() > 0) {
    std::cout << "Chart time: " << metrics.chart_time.count() << " ms" << std::endl;
  }
  std::cout << "Output time: " << metrics.output_time.count() << " ms" << std::endl;
  std::cout << "Total runtime: " << metrics.total_time.count() << " ms" << std::endl;
}

auto ApplicationRunner::display_completion_message() const -> void {
  std::cout << "\n=== CALCULATION COMPLETED SUCCESSFULLY ===" << std::endl;
}

auto ApplicationRunner::cleanup() -> void { io::output::hdf5::finalize(); }

auto ApplicationRunner::handle_error(const ApplicationError& error) -> ApplicationResult {
  std::cerr << "Error: " << error.message << std::endl;
  cleanup();
  return {false, error.exit_code, error.message};
}

} // namespace psychro::core
