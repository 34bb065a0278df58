#include "heatcond/calculator.h"
#include "heatcond/conduction.h"
#include "heatcond/constants.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace heatcond {

// ============================================================================
// Utility Functions
// ============================================================================

std::string statusToString(CalcStatus status) {
    switch (status) {
        case CalcStatus::Success: return "Success";
        case CalcStatus::UnknownFormula: return "UnknownFormula";
        case CalcStatus::UnknownInput: return "UnknownInput";
        case CalcStatus::MissingInput: return "MissingInput";
        case CalcStatus::InvalidQuantity: return "InvalidQuantity";
        case CalcStatus::NonFiniteResult: return "NonFiniteResult";
        default: return "Unknown";
    }
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ============================================================================
// Options File
// ============================================================================

bool loadCalculatorOptionsFromFile(const std::string& path, CalculatorOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "si") {
            if (auto b = parseBool(value)) options.SI = *b;
        } else if (key == "validateInputs") {
            if (auto b = parseBool(value)) options.validateInputs = *b;
        } else if (key == "verbose") {
            if (auto b = parseBool(value)) options.verbose = *b;
        } else if (key == "enableSuperancillaries") {
            if (auto b = parseBool(value)) options.enableSuperancillaries = *b;
        } else if (key == "format") {
            if (auto f = parseFormat(value)) options.format = *f;
        } else if (key == "precision") {
            try {
                int p = std::stoi(value);
                if (p > 0 && p <= 17) options.precision = p;
            } catch (const std::exception&) {
                // keep default
            }
        } else if (key == "fluid") {
            options.fluid = value;
        }
    }
    return true;
}

// ============================================================================
// Input Parsing & Validation
// ============================================================================

Quantity parseQuantity(const std::string& text) {
    std::string s = trim(text);
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin) {
        throw std::invalid_argument("Expected a number: '" + text + "'");
    }
    // Underflow to a subnormal is a valid value, overflow is not
    if (errno == ERANGE && std::isinf(value)) {
        throw std::out_of_range("Number out of range: '" + text + "'");
    }
    Quantity q;
    q.value = value;
    q.unit = trim(std::string(end));
    return q;
}

std::pair<std::string, Quantity> parseAssignment(const std::string& text) {
    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("Expected name=value: '" + text + "'");
    }
    std::string name = trim(text.substr(0, eq));
    if (name.empty()) {
        throw std::invalid_argument("Missing input name: '" + text + "'");
    }
    return {name, parseQuantity(text.substr(eq + 1))};
}

std::optional<bool> parseBool(const std::string& text) {
    std::string s = toLower(trim(text));
    if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
    if (s == "false" || s == "no" || s == "off" || s == "0") return false;
    return std::nullopt;
}

std::optional<std::string> parseFormat(const std::string& text) {
    std::string s = toLower(trim(text));
    if (s == "text" || s == "json") return s;
    return std::nullopt;
}

static std::string describeInvalid(const std::string& quantity, double value, const std::string& reason) {
    std::ostringstream ss;
    ss << quantity << " = " << value << " " << reason;
    return ss.str();
}

InvalidQuantity::InvalidQuantity(const std::string& quantity, double value, const std::string& reason)
    : std::runtime_error(describeInvalid(quantity, value, reason)),
      quantity_(quantity), value_(value) {}

void requirePositive(const std::string& name, double value) {
    if (!std::isfinite(value)) {
        throw InvalidQuantity(name, value, "is not finite");
    }
    if (value <= 0.0) {
        throw InvalidQuantity(name, value, "must be positive");
    }
}

// ============================================================================
// Formula Registry
// ============================================================================

const InputSpec* FormulaInfo::findInput(const std::string& inputName) const {
    for (const auto& input : inputs) {
        if (input.name == inputName) return &input;
    }
    return nullptr;
}

const std::vector<FormulaInfo>& FormulaRegistry::getAll() {
    static const std::vector<FormulaInfo> formulas = {
        {Formula::RToK, "R_to_k",
         {{"R", UnitType::AreaResistance, std::nullopt, true},
          {"t", UnitType::Length, std::nullopt, true},
          {"A", UnitType::Area, 1.0, true}},
         "k", UnitType::Conductivity, false,
         "Thermal conductivity from resistance and thickness, k = t/(A R)"},
        {Formula::KToR, "k_to_R",
         {{"k", UnitType::Conductivity, std::nullopt, true},
          {"t", UnitType::Length, std::nullopt, true},
          {"A", UnitType::Area, 1.0, true}},
         "R", UnitType::ThermalResistance, false,
         "Thermal resistance of a layer, R = t/(k A)"},
        {Formula::KToThermalResistivity, "k_to_thermal_resistivity",
         {{"k", UnitType::Conductivity, std::nullopt, true}},
         "r", UnitType::ThermalResistivity, false,
         "Thermal resistivity, r = 1/k"},
        {Formula::ThermalResistivityToK, "thermal_resistivity_to_k",
         {{"r", UnitType::ThermalResistivity, std::nullopt, true}},
         "k", UnitType::Conductivity, false,
         "Thermal conductivity from resistivity, k = 1/r"},
        {Formula::RValueToK, "R_value_to_k",
         {{"R_value", UnitType::RValue, std::nullopt, true}},
         "k", UnitType::Conductivity, true,
         "Thermal conductivity from an R-value per inch"},
        {Formula::KToRValue, "k_to_R_value",
         {{"k", UnitType::Conductivity, std::nullopt, true}},
         "R_value", UnitType::RValue, true,
         "R-value per inch from thermal conductivity"},
        {Formula::RCylinder, "R_cylinder",
         {{"Di", UnitType::Length, std::nullopt, true},
          {"Do", UnitType::Length, std::nullopt, true},
          {"k", UnitType::Conductivity, std::nullopt, true},
          {"L", UnitType::Length, std::nullopt, true}},
         "R", UnitType::ThermalResistance, false,
         "Thermal resistance of a cylindrical shell, R = ln(Do/Di)/(2 pi k L)"},
    };
    return formulas;
}

const FormulaInfo* FormulaRegistry::find(const std::string& name) {
    const auto& formulas = getAll();
    for (const auto& f : formulas) {
        if (f.name == name) return &f;
    }
    std::string lower = toLower(name);
    for (const auto& f : formulas) {
        if (toLower(f.name) == lower) return &f;
    }
    return nullptr;
}

// ============================================================================
// Calculator
// ============================================================================

Calculator::Calculator(const CalculatorOptions& options)
    : options_(options) {}

CalculationResult Calculator::evaluate(const std::string& formulaName,
                                       const std::map<std::string, Quantity>& inputs) const {
    const FormulaInfo* info = FormulaRegistry::find(formulaName);
    if (!info) {
        CalculationResult result;
        result.formula = formulaName;
        result.status = CalcStatus::UnknownFormula;
        result.errorMessage = "Unknown formula: " + formulaName;
        return result;
    }

    std::map<std::string, double> si;
    bool explicitRValueUnit = false;
    for (const auto& [name, q] : inputs) {
        const InputSpec* spec = info->findInput(name);
        if (!spec) {
            // Reported by evaluateSI with the rest of the input checks
            si[name] = q.value;
            continue;
        }
        if (!UnitConverter::isKnownUnit(spec->unitType, q.unit)) {
            CalculationResult result;
            result.formula = info->name;
            result.output = info->output;
            result.status = CalcStatus::InvalidQuantity;
            result.errorMessage = "Unknown unit '" + q.unit + "' for " + name +
                                  " (expected " + siUnitName(spec->unitType) + ")";
            return result;
        }
        if (spec->unitType == UnitType::RValue && !q.unit.empty()) {
            explicitRValueUnit = true;
        }
        si[name] = UnitConverter::toSI(q.value, spec->unitType, q.unit);
    }

    // An R-value given with units is already normalized to SI
    if (explicitRValueUnit && info->formula == Formula::RValueToK) {
        Calculator siCalculator(options_);
        siCalculator.options_.SI = true;
        return siCalculator.evaluateSI(info->name, si);
    }
    return evaluateSI(info->name, si);
}

CalculationResult Calculator::evaluateSI(const std::string& formulaName,
                                         const std::map<std::string, double>& inputs) const {
    CalculationResult result;
    result.formula = formulaName;
    result.SI = options_.SI;

    const FormulaInfo* info = FormulaRegistry::find(formulaName);
    if (!info) {
        result.status = CalcStatus::UnknownFormula;
        result.errorMessage = "Unknown formula: " + formulaName;
        return result;
    }
    result.formula = info->name;
    result.output = info->output;

    for (const auto& [name, value] : inputs) {
        if (!info->findInput(name)) {
            result.status = CalcStatus::UnknownInput;
            result.errorMessage = "Unknown input '" + name + "' for " + info->name;
            return result;
        }
    }

    std::map<std::string, double> si;
    for (const auto& spec : info->inputs) {
        auto it = inputs.find(spec.name);
        if (it != inputs.end()) {
            si[spec.name] = it->second;
        } else if (spec.defaultValue) {
            si[spec.name] = *spec.defaultValue;
        } else {
            result.status = CalcStatus::MissingInput;
            result.errorMessage = "Missing input '" + spec.name + "' for " + info->name;
            return result;
        }
    }
    result.inputs = si;

    if (options_.validateInputs) {
        try {
            validate(*info, si);
        } catch (const InvalidQuantity& e) {
            result.status = CalcStatus::InvalidQuantity;
            result.errorMessage = e.what();
            return result;
        }
    }

    result.value = compute(info->formula, si, options_.SI);
    if (info->usesUnitSystem && info->outputType == UnitType::RValue && !options_.SI) {
        result.units = "ft^2-F-hr/BTU-in";
    } else {
        result.units = siUnitName(info->outputType);
    }

    if (options_.verbose) {
        std::cerr << "[heatcond] " << info->name << "(";
        bool first = true;
        for (const auto& [name, value] : si) {
            std::cerr << (first ? "" : ", ") << name << "=" << value;
            first = false;
        }
        if (info->usesUnitSystem) std::cerr << (first ? "" : ", ") << "SI=" << (options_.SI ? "true" : "false");
        std::cerr << ") = " << result.value << " " << result.units << "\n";
    }

    if (!std::isfinite(result.value)) {
        result.status = CalcStatus::NonFiniteResult;
        result.errorMessage = info->name + " produced a non-finite result";
        return result;
    }

    result.success = true;
    result.status = CalcStatus::Success;
    return result;
}

void Calculator::validate(const FormulaInfo& info, const std::map<std::string, double>& si) const {
    for (const auto& spec : info.inputs) {
        if (spec.mustBePositive) {
            requirePositive(spec.name, si.at(spec.name));
        }
    }
    if (info.formula == Formula::RCylinder && si.at("Do") <= si.at("Di")) {
        throw InvalidQuantity("Do", si.at("Do"), "must exceed Di");
    }
}

double Calculator::compute(Formula formula, const std::map<std::string, double>& si, bool SI) {
    switch (formula) {
        case Formula::RToK:
            return R_to_k(si.at("R"), si.at("t"), si.at("A"));
        case Formula::KToR:
            return k_to_R(si.at("k"), si.at("t"), si.at("A"));
        case Formula::KToThermalResistivity:
            return k_to_thermal_resistivity(si.at("k"));
        case Formula::ThermalResistivityToK:
            return thermal_resistivity_to_k(si.at("r"));
        case Formula::RValueToK:
            return R_value_to_k(si.at("R_value"), SI);
        case Formula::KToRValue:
            return k_to_R_value(si.at("k"), SI);
        case Formula::RCylinder:
            return R_cylinder(si.at("Di"), si.at("Do"), si.at("k"), si.at("L"));
    }
    throw std::logic_error("Unhandled formula");
}

// ============================================================================
// Reports
// ============================================================================

std::string generateResultText(const CalculationResult& result, int precision) {
    std::ostringstream ss;
    ss << std::setprecision(precision);
    if (!result.success) {
        ss << "Error (" << statusToString(result.status) << "): " << result.errorMessage << "\n";
        return ss.str();
    }
    ss << result.output << " = " << result.value;
    if (!result.units.empty()) ss << " " << result.units;
    ss << "\n";
    return ss.str();
}

std::string generateResultJSON(const CalculationResult& result) {
    nlohmann::json j;

    j["formula"] = result.formula;
    j["success"] = result.success;
    j["status"] = statusToString(result.status);

    nlohmann::json inputsJson = nlohmann::json::object();
    for (const auto& [name, value] : result.inputs) {
        inputsJson[name] = value;
    }
    j["inputs"] = inputsJson;

    const FormulaInfo* info = FormulaRegistry::find(result.formula);
    if (info && info->usesUnitSystem) {
        j["SI"] = result.SI;
    }

    if (result.status == CalcStatus::Success || result.status == CalcStatus::NonFiniteResult) {
        j["output"]["name"] = result.output;
        j["output"]["value"] = result.value;  // inf/NaN serialize as null
        j["output"]["units"] = result.units;
    }

    if (!result.errorMessage.empty()) {
        j["error"] = result.errorMessage;
    }

    return j.dump(2);
}

std::string generateFormulaList() {
    std::ostringstream ss;
    for (const auto& f : FormulaRegistry::getAll()) {
        ss << f.name << "(";
        for (size_t i = 0; i < f.inputs.size(); ++i) {
            const auto& in = f.inputs[i];
            if (i > 0) ss << ", ";
            ss << in.name;
            if (in.defaultValue) ss << "=" << *in.defaultValue;
            ss << " [" << siUnitName(in.unitType) << "]";
        }
        if (f.usesUnitSystem) ss << ", SI=true";
        ss << ") -> " << f.output << " [" << siUnitName(f.outputType) << "]\n";
        ss << "    " << f.description << "\n";
    }
    return ss.str();
}

std::string generateConstantsList() {
    std::ostringstream ss;
    ss << std::setprecision(16);
    for (const auto& [name, info] : Constants::getAll()) {
        ss << name << " = " << info.value;
        if (!info.units.empty()) ss << " " << info.units;
        ss << "    " << info.description << "\n";
    }
    return ss.str();
}

}  // namespace heatcond
