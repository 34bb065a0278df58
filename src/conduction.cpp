#include "heatcond/conduction.h"
#include "heatcond/constants.h"
#include <cmath>

namespace heatcond {

using namespace constants;

// Imperial R-value per inch to SI resistivity: ft^2-F-h/BTU-in -> m-K/W
static double imperialRValueFactor() {
    return (foot * foot) * degree_Fahrenheit * hour / Btu / inch;
}

double R_to_k(double R, double t, double A) {
    return t / (A * R);
}

double k_to_R(double k, double t, double A) {
    return t / (k * A);
}

double k_to_thermal_resistivity(double k) {
    return 1.0 / k;
}

double thermal_resistivity_to_k(double r) {
    return 1.0 / r;
}

double R_value_to_k(double R_value, bool SI) {
    double r;
    if (SI) {
        r = R_value / inch;
    } else {
        r = R_value * (foot * foot) * degree_Fahrenheit * hour / Btu / inch;
    }
    return thermal_resistivity_to_k(r);
}

double k_to_R_value(double k, bool SI) {
    double r = k_to_thermal_resistivity(k);
    if (SI) {
        return r * inch;
    }
    return r / imperialRValueFactor();
}

double R_cylinder(double Di, double Do, double k, double L) {
    double hA = k * 2.0 * pi * L / std::log(Do / Di);
    return 1.0 / hA;
}

}  // namespace heatcond
