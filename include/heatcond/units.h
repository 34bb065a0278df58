#pragma once

#include <string>

namespace heatcond {

// Unit types relevant for conduction calculations
enum class UnitType {
    Temperature,           // K, C, F, R (absolute, affine conversion)
    Pressure,              // Pa, kPa, bar, MPa, psi, atm
    Length,                // m, cm, mm, ft, in
    Area,                  // m^2, cm^2, mm^2, ft^2, in^2
    Conductivity,          // W/m-K, BTU/hr-ft-F
    ThermalResistance,     // K/W, F-hr/BTU
    AreaResistance,        // m^2-K/W, ft^2-F-hr/BTU
    ThermalResistivity,    // m-K/W
    RValue                 // m^2-K/W-in, ft^2-F-hr/BTU-in
};

/**
 * @brief A numeric value with the unit it was given in.
 */
struct Quantity {
    double value = 0.0;
    std::string unit;  // Empty means SI
};

// Name of the SI unit a UnitType is stored in
std::string siUnitName(UnitType type);

class UnitConverter {
public:
    // Convert value from the specified unit to SI
    // SI units: K, Pa, m, m^2, s, J, W, W/m-K, K/W, m^2-K/W, m-K/W;
    // R-values stay per inch of thickness (m^2-K/W-in)
    static double toSI(double value, UnitType type, const std::string& unit);
    
    // Convert value from SI to the specified unit
    static double fromSI(double value, UnitType type, const std::string& unit);
    
    // True when the unit string is recognized for this type (empty means SI)
    static bool isKnownUnit(UnitType type, const std::string& unit);

    /**
     * @brief Convert a Quantity to SI, rejecting units not known for the type.
     * @throws std::invalid_argument naming `what` and the unit
     */
    static double quantityToSI(const Quantity& q, UnitType type, const std::string& what);
};

} // namespace heatcond
