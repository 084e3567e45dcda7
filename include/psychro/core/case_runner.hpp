#pragma once
#include "../io/chart_generator.hpp"
#include "../io/config_types.hpp"
#include "../io/output/output_types.hpp"
#include "../properties/humid_air_state.hpp"
#include "../solver/solver_types.hpp"
#include "application_types.hpp"
#include "exceptions.hpp"
#include <expected>
#include <vector>

namespace psychro::core {

/// Inlet flow described by a stream configuration
[[nodiscard]] auto build_flow(const io::FlowConfig& config)
    -> std::expected<properties::HumidAirFlow, CalculationError>;

[[nodiscard]] auto to_solver_config(const io::SolverSettings& settings) noexcept -> solver::SolverConfig;

/**
 * @brief Run one configured process case
 *
 * @param config Case definition
 * @param settings Solver settings used by the iterating process adapters
 * @return Record with inlets, outlet, heat of process and coil quantities
 */
[[nodiscard]] auto run_case(const io::CaseConfig& config, const io::SolverSettings& settings = {})
    -> std::expected<io::output::CaseRecord, CalculationError>;

class CaseRunner {
public:
  // Run every configured case; the first failing case aborts the run
  [[nodiscard]] auto run_cases(const io::Configuration& config, PerformanceMetrics& metrics)
      -> std::expected<std::vector<io::output::CaseRecord>, ApplicationError>;

  // Build the chart tables when enabled in the configuration
  [[nodiscard]] auto run_chart(const io::Configuration& config, PerformanceMetrics& metrics)
      -> std::expected<io::ChartGenerator::Result, ApplicationError>;

  auto display_case_results(const std::vector<io::output::CaseRecord>& records, bool verbose) const -> void;

private:
  auto display_record(const io::output::CaseRecord& record, bool verbose) const -> void;
  auto display_stream(std::string_view label, const io::output::StreamRecord& stream, bool verbose) const -> void;
};

} // namespace psychro::core
