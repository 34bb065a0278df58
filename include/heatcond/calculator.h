#pragma once

#include "heatcond/units.h"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace heatcond {

// ============================================================================
// Calculator Status & Options
// ============================================================================

/**
 * @brief Status codes for a formula evaluation.
 */
enum class CalcStatus {
    Success,          // Finite result computed
    UnknownFormula,   // No formula with that name
    UnknownInput,     // Input name not declared by the formula
    MissingInput,     // Required input not supplied
    InvalidQuantity,  // Input outside its physical range
    NonFiniteResult   // Formula produced inf or NaN
};

/**
 * @brief Convert CalcStatus to string for reports.
 */
std::string statusToString(CalcStatus status);

/**
 * @brief Options for the calculator and the command line front end.
 */
struct CalculatorOptions {
    bool SI = true;                      // R-value unit system
    bool validateInputs = true;          // Range-check inputs before evaluating
    std::string format = "text";         // Report format: text or json
    int precision = 16;                  // Significant digits in text reports
    bool verbose = false;                // Trace evaluation on stderr
    bool enableSuperancillaries = true;  // CoolProp superancillary functions
    std::string fluid;                   // Default fluid for conductivity lookup
};

/**
 * @brief Load calculator options from a "key = value" file.
 *
 * Lines starting with '#' are comments. Unknown keys are ignored and a
 * malformed value leaves the corresponding option unchanged.
 *
 * @return false if the file could not be opened
 */
bool loadCalculatorOptionsFromFile(const std::string& path, CalculatorOptions& options);

// ============================================================================
// Input Parsing & Validation
// ============================================================================

/**
 * @brief Parse "0.025", "25 mm" or "1.5in" into a Quantity.
 * @throws std::invalid_argument if no leading number is found
 * @throws std::out_of_range if the number overflows a double
 */
Quantity parseQuantity(const std::string& text);

/**
 * @brief Parse "name=value[unit]".
 * @throws std::invalid_argument on a missing '=' or empty name
 */
std::pair<std::string, Quantity> parseAssignment(const std::string& text);

// Accepts true/false, yes/no, on/off, 1/0 (case-insensitive)
std::optional<bool> parseBool(const std::string& text);

// Lowercased report format if it is "text" or "json", nullopt otherwise
std::optional<std::string> parseFormat(const std::string& text);

/**
 * @brief Raised when a physical quantity is outside its valid range.
 */
class InvalidQuantity : public std::runtime_error {
public:
    InvalidQuantity(const std::string& quantity, double value, const std::string& reason);

    const std::string& quantity() const { return quantity_; }
    double value() const { return value_; }

private:
    std::string quantity_;
    double value_;
};

/// Throws InvalidQuantity unless value is finite and strictly positive.
void requirePositive(const std::string& name, double value);

// ============================================================================
// Formula Registry
// ============================================================================

enum class Formula {
    RToK,
    KToR,
    KToThermalResistivity,
    ThermalResistivityToK,
    RValueToK,
    KToRValue,
    RCylinder
};

struct InputSpec {
    std::string name;
    UnitType unitType;
    std::optional<double> defaultValue;  // SI value used when not supplied
    bool mustBePositive = true;
};

struct FormulaInfo {
    Formula formula;
    std::string name;
    std::vector<InputSpec> inputs;
    std::string output;
    UnitType outputType;
    bool usesUnitSystem = false;  // Result depends on the SI/Imperial flag
    std::string description;

    const InputSpec* findInput(const std::string& inputName) const;
};

class FormulaRegistry {
public:
    static const std::vector<FormulaInfo>& getAll();

    // Exact name first, then case-insensitive. nullptr if unknown.
    static const FormulaInfo* find(const std::string& name);
};

// ============================================================================
// Calculator
// ============================================================================

struct CalculationResult {
    bool success = false;
    CalcStatus status = CalcStatus::UnknownFormula;
    std::string formula;
    std::string output;                   // Output quantity name (k, R, r, R_value)
    double value = 0.0;
    std::string units;
    std::map<std::string, double> inputs; // SI values actually used
    bool SI = true;
    std::string errorMessage;
};

/**
 * @brief Evaluates conduction formulas by name from user-supplied inputs.
 *
 * Bad input is reported through CalculationResult::status, never thrown.
 */
class Calculator {
public:
    explicit Calculator(const CalculatorOptions& options = CalculatorOptions());

    // Inputs carry their own units and are converted to SI first
    CalculationResult evaluate(const std::string& formulaName,
                               const std::map<std::string, Quantity>& inputs) const;

    // Inputs already in SI
    CalculationResult evaluateSI(const std::string& formulaName,
                                 const std::map<std::string, double>& inputs) const;

private:
    CalculatorOptions options_;

    void validate(const FormulaInfo& info, const std::map<std::string, double>& si) const;
    static double compute(Formula formula, const std::map<std::string, double>& si, bool SI);
};

// ============================================================================
// Reports
// ============================================================================

std::string generateResultText(const CalculationResult& result, int precision = 16);
std::string generateResultJSON(const CalculationResult& result);
std::string generateFormulaList();

// Unit factors from the constants registry, one per line with units
std::string generateConstantsList();

}  // namespace heatcond
