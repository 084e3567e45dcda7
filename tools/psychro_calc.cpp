#include "psychro/properties/humid_air.hpp"
#include "psychro/properties/humid_air_state.hpp"
#include <expected>
#include <iomanip>
#include <iostream>
#include <string>

namespace humid_air = psychro::properties::humid_air;
using psychro::properties::HumidAir;

void print_usage() {
    std::cout << "Usage:\n";
    std::cout << "  psychro_calc <pressure_Pa> <mode> <value1> <value2>\n";
    std::cout << "\nModes:\n";
    std::cout << "  TRH   - Dry-bulb temperature [degC] and relative humidity [%]\n";
    std::cout << "  TX    - Dry-bulb temperature [degC] and humidity ratio [kg/kg]\n";
    std::cout << "  HX    - Specific enthalpy [kJ/kg] and humidity ratio [kg/kg]\n";
    std::cout << "  TDP   - Dry-bulb temperature [degC] and dew point temperature [degC]\n";
    std::cout << "  WBRH  - Wet-bulb temperature [degC] and relative humidity [%]\n";
    std::cout << "\nExamples:\n";
    std::cout << "  psychro_calc 101325 TRH 20 50\n";
    std::cout << "  psychro_calc 101325 HX 45.5 0.0098\n";
}

std::expected<HumidAir, psychro::core::CalculationError> resolve_state(double pressure, const std::string& mode,
                                                                      double v1, double v2) {
    if (mode == "TRH") {
        return HumidAir::from_relative_humidity(pressure, v1, v2);
    }
    if (mode == "TX") {
        return HumidAir::from_humidity_ratio(pressure, v1, v2);
    }
    if (mode == "HX") {
        auto temperature = humid_air::dry_bulb_temperature_from_enthalpy(v1, v2, pressure);
        if (!temperature) {
            return std::unexpected(temperature.error());
        }
        return HumidAir::from_humidity_ratio(pressure, *temperature, v2);
    }
    if (mode == "TDP") {
        auto rh = humid_air::relative_humidity_from_dew_point(v2, v1);
        if (!rh) {
            return std::unexpected(rh.error());
        }
        return HumidAir::from_relative_humidity(pressure, v1, *rh);
    }
    if (mode == "WBRH") {
        auto temperature = humid_air::dry_bulb_temperature_from_wet_bulb(v1, v2, pressure);
        if (!temperature) {
            return std::unexpected(temperature.error());
        }
        return HumidAir::from_relative_humidity(pressure, *temperature, v2);
    }
    return std::unexpected(
        psychro::core::InvalidArgumentError("unknown mode '" + mode + "', use TRH, TX, HX, TDP or WBRH"));
}

int main(int argc, char* argv[]) {
    if (argc < 5) {
        print_usage();
        return 1;
    }

    double pressure = 0.0;
    double v1 = 0.0;
    double v2 = 0.0;
    std::string mode = argv[2];
    try {
        pressure = std::stod(argv[1]);
        v1 = std::stod(argv[3]);
        v2 = std::stod(argv[4]);
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    auto state = resolve_state(pressure, mode, v1, v2);
    if (!state) {
        std::cerr << "Error: " << state.error().message() << "\n";
        return 1;
    }
    const auto& air = *state;

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "\n=== Humid Air State ===\n";
    std::cout << "Pressure: " << air.pressure() << " Pa\n";
    std::cout << "Dry-bulb temperature: " << air.temperature() << " degC\n";
    std::cout << "Relative humidity: " << air.relative_humidity() << " %\n";
    std::cout << "Humidity ratio: " << air.humidity_ratio() << " kg/kg\n";
    std::cout << "Saturation pressure: " << air.saturation_pressure() << " Pa\n";
    std::cout << "Dew point temperature: " << air.dew_point_temperature() << " degC\n";
    std::cout << "Specific enthalpy: " << air.specific_enthalpy() << " kJ/kg\n";
    std::cout << "Density: " << air.density() << " kg/m3\n";

    if (auto wet_bulb = air.wet_bulb_temperature()) {
        std::cout << "Wet-bulb temperature: " << *wet_bulb << " degC\n";
    } else {
        std::cerr << "Warning: wet-bulb temperature unavailable: " << wet_bulb.error().message() << "\n";
    }

    std::cout << "\nTransport Properties:\n";
    if (auto cp = humid_air::specific_heat(air.temperature(), air.humidity_ratio())) {
        std::cout << "  Cp: " << *cp << " kJ/(kg.K)\n";
    }
    if (auto mu = humid_air::dynamic_viscosity(air.temperature(), air.humidity_ratio())) {
        std::cout << "  Dynamic viscosity: " << *mu << " Pa.s\n";
    }
    if (auto nu = humid_air::kinematic_viscosity(air.temperature(), air.humidity_ratio(), air.pressure())) {
        std::cout << "  Kinematic viscosity: " << *nu << " m2/s\n";
    }
    if (auto k = humid_air::thermal_conductivity(air.temperature(), air.humidity_ratio())) {
        std::cout << "  Thermal conductivity: " << *k << " W/(m.K)\n";
    }

    return 0;
}
