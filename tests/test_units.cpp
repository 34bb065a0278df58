#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "heatcond/constants.h"
#include "heatcond/units.h"
#include "heatcond/conduction.h"
#include <stdexcept>
#include <string>

using namespace heatcond;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Constants
// ============================================================================

TEST_CASE("Unit factor constants", "[constants]") {
    REQUIRE(constants::inch == 0.0254);
    REQUIRE_THAT(constants::foot, WithinRel(0.3048, 1e-15));
    REQUIRE(constants::hour == 3600.0);
    REQUIRE_THAT(constants::degree_Fahrenheit, WithinRel(5.0 / 9.0, 1e-15));
    REQUIRE_THAT(constants::pound, WithinRel(0.45359237, 1e-15));
    REQUIRE_THAT(constants::Btu, WithinRel(1055.05585262, 1e-12));
}

TEST_CASE("Constants registry mirrors the unit factors", "[constants]") {
    const auto& all = Constants::getAll();
    REQUIRE(all.size() == 15);

    REQUIRE(all.at("inch").value == constants::inch);
    REQUIRE(all.at("Btu").value == constants::Btu);
    REQUIRE(all.at("Btu").units == "J");
    REQUIRE(all.at("degree_Fahrenheit").value == constants::degree_Fahrenheit);
    REQUIRE(all.at("degree_Fahrenheit").units == "K");

    // Solver-style names are not unit factors
    REQUIRE(all.count("PI") == 0);
    REQUIRE(all.count("g#") == 0);
    REQUIRE(all.count("sigma#") == 0);
}

// ============================================================================
// Unit Conversion
// ============================================================================

TEST_CASE("Length and area conversions", "[units]") {
    REQUIRE_THAT(UnitConverter::toSI(1.0, UnitType::Length, "in"), WithinRel(0.0254, 1e-15));
    REQUIRE_THAT(UnitConverter::toSI(25.0, UnitType::Length, "mm"), WithinRel(0.025, 1e-15));
    REQUIRE_THAT(UnitConverter::toSI(1.0, UnitType::Length, "FT"), WithinRel(0.3048, 1e-15));
    REQUIRE_THAT(UnitConverter::fromSI(0.3048, UnitType::Length, "in"), WithinRel(12.0, 1e-14));
    REQUIRE_THAT(UnitConverter::toSI(1.0, UnitType::Area, "ft^2"), WithinRel(0.09290304, 1e-14));
}

TEST_CASE("Temperature conversion is affine", "[units]") {
    REQUIRE_THAT(UnitConverter::toSI(32.0, UnitType::Temperature, "F"), WithinAbs(273.15, 1e-12));
    REQUIRE_THAT(UnitConverter::toSI(25.0, UnitType::Temperature, "C"), WithinAbs(298.15, 1e-12));
    REQUIRE_THAT(UnitConverter::fromSI(373.15, UnitType::Temperature, "F"), WithinAbs(212.0, 1e-10));
    REQUIRE_THAT(UnitConverter::toSI(491.67, UnitType::Temperature, "R"), WithinAbs(273.15, 1e-10));
}

TEST_CASE("Conductivity in BTU units", "[units]") {
    // 1 BTU/hr-ft-F = 1.730735 W/m-K
    REQUIRE_THAT(UnitConverter::toSI(1.0, UnitType::Conductivity, "BTU/hr-ft-F"), WithinRel(1.730735, 1e-6));
    // 1 BTU-in/hr-ft^2-F = 0.1442279 W/m-K
    REQUIRE_THAT(UnitConverter::toSI(1.0, UnitType::Conductivity, "BTU-in/hr-ft^2-F"), WithinRel(0.1442279, 1e-6));
    REQUIRE_THAT(UnitConverter::toSI(26.0, UnitType::Conductivity, "mW/m-K"), WithinRel(0.026, 1e-14));
}

TEST_CASE("Imperial R-value conversion agrees with R_value_to_k", "[units][rvalue]") {
    for (double rv : {0.71, 3.14, 6.5}) {
        double siRValue = UnitConverter::toSI(rv, UnitType::RValue, "ft^2-F-hr/BTU-in");
        REQUIRE_THAT(R_value_to_k(siRValue, true), WithinRel(R_value_to_k(rv, false), 1e-13));
        REQUIRE_THAT(UnitConverter::fromSI(siRValue, UnitType::RValue, "ft^2-F-hr/BTU-in"), WithinRel(rv, 1e-14));
    }
}

TEST_CASE("Area resistance RSI to US R", "[units]") {
    // RSI 1 m^2-K/W = R-5.678 ft^2-F-hr/BTU
    REQUIRE_THAT(UnitConverter::fromSI(1.0, UnitType::AreaResistance, "ft^2-F-hr/BTU"), WithinRel(5.678263341113488, 1e-12));
}

TEST_CASE("Unknown units pass through and are reported", "[units]") {
    REQUIRE(UnitConverter::toSI(3.0, UnitType::Length, "furlong") == 3.0);
    REQUIRE_FALSE(UnitConverter::isKnownUnit(UnitType::Length, "furlong"));
    REQUIRE(UnitConverter::isKnownUnit(UnitType::Length, ""));
    REQUIRE(UnitConverter::isKnownUnit(UnitType::Length, " M M "));
    REQUIRE(UnitConverter::isKnownUnit(UnitType::Temperature, "celsius"));
    REQUIRE(siUnitName(UnitType::Conductivity) == "W/m-K");
}

TEST_CASE("Non-ASCII unit text is rejected, not misread", "[units]") {
    // UTF-8 degree sign: high bytes must not reach tolower/isspace as negative chars
    const std::string degF = "\xC2\xB0" "F";
    REQUIRE_FALSE(UnitConverter::isKnownUnit(UnitType::Temperature, degF));
    REQUIRE(UnitConverter::toSI(77.0, UnitType::Temperature, degF) == 77.0);
    REQUIRE_FALSE(UnitConverter::isKnownUnit(UnitType::Length, "\xFF" "m"));
}

TEST_CASE("quantityToSI rejects units of the wrong kind", "[units]") {
    REQUIRE_THAT(UnitConverter::quantityToSI(Quantity{1.0, "atm"}, UnitType::Pressure, "P"),
                 WithinRel(101325.0, 1e-15));
    REQUIRE_THAT(UnitConverter::quantityToSI(Quantity{25.0, "C"}, UnitType::Temperature, "T"),
                 WithinAbs(298.15, 1e-12));
    REQUIRE(UnitConverter::quantityToSI(Quantity{300.0, ""}, UnitType::Temperature, "T") == 300.0);

    REQUIRE_THROWS_AS(UnitConverter::quantityToSI(Quantity{25.0, "degC"}, UnitType::Temperature, "T"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(UnitConverter::quantityToSI(Quantity{1.0, "psig"}, UnitType::Pressure, "P"),
                      std::invalid_argument);
    // A length is not a pressure
    REQUIRE_THROWS_AS(UnitConverter::quantityToSI(Quantity{1.0, "m"}, UnitType::Pressure, "P"),
                      std::invalid_argument);
}
