#pragma once

#include <string>
#include <map>

namespace heatcond {

// Unit factors in SI base units, defined the way the scipy/CODATA tables do
namespace constants {

inline constexpr double pi = 3.14159265358979323846;

// Length [m]
inline constexpr double inch = 0.0254;
inline constexpr double foot = 12.0 * inch;

// Time [s]
inline constexpr double minute = 60.0;
inline constexpr double hour = 60.0 * minute;

// Mass [kg]
inline constexpr double gram = 1e-3;
inline constexpr double grain = 64.79891e-6;
inline constexpr double pound = 7000.0 * grain;

// Temperature
inline constexpr double zero_Celsius = 273.15;
inline constexpr double degree_Fahrenheit = 1.0 / 1.8;  // size of one degree F in K

// Energy [J], International Table definitions
inline constexpr double calorie_IT = 4.1868;
inline constexpr double Btu = pound * degree_Fahrenheit * calorie_IT / gram;

// Pressure [Pa]
inline constexpr double g = 9.80665;
inline constexpr double atm = 101325.0;
inline constexpr double psi = pound * g / (inch * inch);

}  // namespace constants

struct ConstantInfo {
    double value;
    std::string units;
    std::string description;
};

// Named view of the unit factors above, for listing and reports
class Constants {
public:
    // Get the full map of constants
    static const std::map<std::string, ConstantInfo>& getAll();

private:
    static const std::map<std::string, ConstantInfo> registry_;
};

} // namespace heatcond
