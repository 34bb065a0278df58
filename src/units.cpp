#include "heatcond/units.h"
#include "heatcond/constants.h"
#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

namespace heatcond {

using namespace constants;

// Helper to normalize unit strings (lowercase, remove spaces)
static std::string normalize(const std::string& unit) {
    std::string s = unit;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // Remove spaces
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; }),
            s.end());
    return s;
}

// Multiplicative factor taking a value in unit `u` to SI.
// Temperature is affine and handled by the callers.
static std::optional<double> factorToSI(UnitType type, const std::string& u) {
    if (u.empty()) return 1.0;

    switch (type) {
        case UnitType::Temperature:
            break;

        case UnitType::Pressure:
            if (u == "pa" || u == "pascal") return 1.0;
            if (u == "kpa") return 1000.0;
            if (u == "mpa") return 1e6;
            if (u == "bar") return 1e5;
            if (u == "atm") return atm;
            if (u == "psi" || u == "psia") return psi;
            break;

        case UnitType::Length:
            if (u == "m" || u == "meter") return 1.0;
            if (u == "cm") return 1e-2;
            if (u == "mm") return 1e-3;
            if (u == "ft" || u == "foot") return foot;
            if (u == "in" || u == "inch") return inch;
            break;

        case UnitType::Area:
            if (u == "m^2" || u == "m2") return 1.0;
            if (u == "cm^2" || u == "cm2") return 1e-4;
            if (u == "mm^2" || u == "mm2") return 1e-6;
            if (u == "ft^2" || u == "ft2") return foot * foot;
            if (u == "in^2" || u == "in2") return inch * inch;
            break;

        case UnitType::Conductivity:
            if (u == "w/m-k" || u == "w/mk") return 1.0;
            if (u == "mw/m-k" || u == "mw/mk") return 1e-3;
            if (u == "btu/hr-ft-f") return Btu / (hour * foot * degree_Fahrenheit);
            if (u == "btu-in/hr-ft^2-f") return Btu * inch / (hour * foot * foot * degree_Fahrenheit);
            break;

        case UnitType::ThermalResistance:
            if (u == "k/w" || u == "c/w") return 1.0;
            if (u == "f-hr/btu" || u == "f-h/btu") return degree_Fahrenheit * hour / Btu;
            break;

        case UnitType::AreaResistance:
            if (u == "m^2-k/w" || u == "m2k/w" || u == "m^2-c/w") return 1.0;
            // Total resistance of a unit-area sample
            if (u == "k/w" || u == "c/w") return 1.0;
            if (u == "ft^2-f-hr/btu" || u == "ft2fhr/btu") return foot * foot * degree_Fahrenheit * hour / Btu;
            break;

        case UnitType::ThermalResistivity:
            if (u == "m-k/w" || u == "mk/w") return 1.0;
            if (u == "ft-f-hr/btu") return foot * degree_Fahrenheit * hour / Btu;
            break;

        case UnitType::RValue:
            if (u == "m^2-k/w-in" || u == "si") return 1.0;
            if (u == "ft^2-f-hr/btu-in" || u == "imperial") return foot * foot * degree_Fahrenheit * hour / Btu;
            break;
    }

    return std::nullopt;
}

std::string siUnitName(UnitType type) {
    switch (type) {
        case UnitType::Temperature: return "K";
        case UnitType::Pressure: return "Pa";
        case UnitType::Length: return "m";
        case UnitType::Area: return "m^2";
        case UnitType::Conductivity: return "W/m-K";
        case UnitType::ThermalResistance: return "K/W";
        case UnitType::AreaResistance: return "m^2-K/W";
        case UnitType::ThermalResistivity: return "m-K/W";
        case UnitType::RValue: return "m^2-K/W-in";
    }
    return "";
}

double UnitConverter::toSI(double value, UnitType type, const std::string& unit) {
    std::string u = normalize(unit);

    if (type == UnitType::Temperature) {
        if (u.empty() || u == "k" || u == "kelvin") return value;
        if (u == "c" || u == "celsius") return value + zero_Celsius;
        if (u == "f" || u == "fahrenheit") return (value - 32.0) * degree_Fahrenheit + zero_Celsius;
        if (u == "r" || u == "rankine") return value * degree_Fahrenheit;
        return value;
    }

    // Default: assume no conversion if unit not recognized
    auto factor = factorToSI(type, u);
    return factor ? value * *factor : value;
}

double UnitConverter::fromSI(double value, UnitType type, const std::string& unit) {
    std::string u = normalize(unit);

    if (type == UnitType::Temperature) {
        if (u.empty() || u == "k" || u == "kelvin") return value;
        if (u == "c" || u == "celsius") return value - zero_Celsius;
        if (u == "f" || u == "fahrenheit") return (value - zero_Celsius) / degree_Fahrenheit + 32.0;
        if (u == "r" || u == "rankine") return value / degree_Fahrenheit;
        return value;
    }

    auto factor = factorToSI(type, u);
    return factor ? value / *factor : value;
}

bool UnitConverter::isKnownUnit(UnitType type, const std::string& unit) {
    std::string u = normalize(unit);
    if (type == UnitType::Temperature) {
        return u.empty() || u == "k" || u == "kelvin" || u == "c" || u == "celsius" ||
               u == "f" || u == "fahrenheit" || u == "r" || u == "rankine";
    }
    return factorToSI(type, u).has_value();
}

double UnitConverter::quantityToSI(const Quantity& q, UnitType type, const std::string& what) {
    if (!isKnownUnit(type, q.unit)) {
        throw std::invalid_argument("Unknown unit '" + q.unit + "' for " + what +
                                    " (expected " + siUnitName(type) + ")");
    }
    return toSI(q.value, type, q.unit);
}

} // namespace heatcond
