#include "heatcond/constants.h"

namespace heatcond {

// Every factor the unit converter and the R-value formulas read
const std::map<std::string, ConstantInfo> Constants::registry_ = {
    {"pi", {constants::pi, "", "Pi"}},
    {"inch", {constants::inch, "m", "International inch"}},
    {"foot", {constants::foot, "m", "International foot"}},
    {"minute", {constants::minute, "s", "Minute"}},
    {"hour", {constants::hour, "s", "Hour"}},
    {"gram", {constants::gram, "kg", "Gram"}},
    {"grain", {constants::grain, "kg", "Grain"}},
    {"pound", {constants::pound, "kg", "Avoirdupois pound"}},
    {"calorie_IT", {constants::calorie_IT, "J", "International Table calorie"}},
    {"Btu", {constants::Btu, "J", "International Table British thermal unit"}},
    {"degree_Fahrenheit", {constants::degree_Fahrenheit, "K", "Temperature increment of one degree Fahrenheit"}},
    {"zero_Celsius", {constants::zero_Celsius, "K", "Zero of the Celsius scale"}},
    {"g", {constants::g, "m/s^2", "Standard gravity"}},
    {"atm", {constants::atm, "Pa", "Standard atmosphere"}},
    {"psi", {constants::psi, "Pa", "Pound-force per square inch"}}
};

const std::map<std::string, ConstantInfo>& Constants::getAll() {
    return registry_;
}

} // namespace heatcond
