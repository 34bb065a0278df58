#pragma once

namespace heatcond {

// ============================================================================
// Conduction Property Conversions
// ============================================================================
//
// Closed-form conversions between thermal conductivity k [W/m-K], thermal
// resistance R [K/W or m^2-K/W], thermal resistivity r [m-K/W] and R-value
// per inch of thickness. Inputs are not validated: zero or negative
// denominators produce IEEE infinities or NaN.

/**
 * @brief Thermal conductivity from a measured thermal resistance.
 *
 * k = t / (A R)
 *
 * @param R Thermal resistance [K/W, or m^2-K/W when A = 1]
 * @param t Thickness of the layer R was measured on [m]
 * @param A Area [m^2]; tabulated resistances are usually per unit area
 * @return Thermal conductivity [W/m-K]
 */
double R_to_k(double R, double t, double A = 1.0);

/**
 * @brief Thermal resistance of a layer of given conductivity.
 *
 * R = t / (k A)
 *
 * @param k Thermal conductivity [W/m-K]
 * @param t Thickness [m]
 * @param A Area [m^2]
 * @return Thermal resistance [K/W]
 */
double k_to_R(double k, double t, double A = 1.0);

/**
 * @brief Thermal resistivity, r = 1/k [m-K/W].
 *
 * Not to be confused with thermal resistance, which depends on geometry.
 */
double k_to_thermal_resistivity(double k);

/**
 * @brief Thermal conductivity from resistivity, k = 1/r [W/m-K].
 */
double thermal_resistivity_to_k(double r);

/**
 * @brief Thermal conductivity from an insulation R-value per inch.
 *
 * With SI = true the R-value is in m^2-K/(W in) and is divided by one inch
 * to give a resistivity. Otherwise it is in ft^2-F-h/(BTU in) and is first
 * brought to SI with the foot, degree Fahrenheit, hour and BTU factors.
 *
 * @param R_value R-value per inch of thickness
 * @param SI Whether R_value is in SI or Imperial units
 * @return Thermal conductivity [W/m-K]
 */
double R_value_to_k(double R_value, bool SI = true);

/**
 * @brief R-value per inch of a material of conductivity k.
 *
 * Inverse of R_value_to_k for the same SI flag.
 */
double k_to_R_value(double k, bool SI = true);

/**
 * @brief Thermal resistance of a cylindrical shell in radial conduction.
 *
 * (hA) = 2 pi k L / ln(Do/Di),  R = 1 / (hA)
 *
 * @param Di Inner diameter [m]
 * @param Do Outer diameter [m], must exceed Di
 * @param k Thermal conductivity of the shell [W/m-K]
 * @param L Length of the cylinder [m]
 * @return Thermal resistance [K/W]
 */
double R_cylinder(double Di, double Do, double k, double L);

}  // namespace heatcond
