#pragma once

#include "heatcond/units.h"
#include <string>
#include <vector>
#include <memory>
#include <map>

namespace heatcond {

// ============================================================================
// CoolProp Configuration
// ============================================================================

struct CoolPropConfig {
    bool enableSuperancillaries = true;  // Faster VLE but more init time
};

/// Apply CoolProp global configuration settings (call before any CoolProp calls)
void applyCoolPropConfig(const CoolPropConfig& config);

// ============================================================================
// Fluids
// ============================================================================

enum class FluidType {
    Real,
    IdealGas,
    Incompressible,
    Unknown
};

class Fluid {
public:
    virtual ~Fluid() = default;
    
    virtual std::string getName() const = 0;
    virtual std::string getCoolPropName() const = 0;
    virtual FluidType getType() const = 0;
    
    /**
     * @brief Thermal conductivity at temperature T [K] and pressure P [Pa].
     * 
     * @return k [W/m-K]
     * @throws std::runtime_error if the state cannot be evaluated
     */
    virtual double conductivity(double T, double P) const;
};

class RealFluid : public Fluid {
public:
    RealFluid(const std::string& name, const std::string& cpName) 
        : name_(name), cpName_(cpName) {}
        
    std::string getName() const override { return name_; }
    std::string getCoolPropName() const override { return cpName_; }
    FluidType getType() const override { return FluidType::Real; }

private:
    std::string name_;
    std::string cpName_;
};

// Gas-phase aliases (Air, N2, CO2, ...). CoolProp still evaluates the full
// transport model, so pressure matters only weakly.
class IdealGasFluid : public Fluid {
public:
    IdealGasFluid(const std::string& name, const std::string& cpName) 
        : name_(name), cpName_(cpName) {}
        
    std::string getName() const override { return name_; }
    std::string getCoolPropName() const override { return cpName_; }
    FluidType getType() const override { return FluidType::IdealGas; }

private:
    std::string name_;
    std::string cpName_;
};

class IncompressibleFluid : public Fluid {
public:
    explicit IncompressibleFluid(const std::string& name) : name_(name) {}
    std::string getName() const override { return name_; }
    std::string getCoolPropName() const override { return "INCOMP::" + name_; }
    FluidType getType() const override { return FluidType::Incompressible; }

private:
    std::string name_;
};

class UnsupportedFluid : public Fluid {
public:
    UnsupportedFluid(const std::string& name, const std::string& reason) 
        : name_(name), reason_(reason) {}
    std::string getName() const override { return name_; }
    std::string getCoolPropName() const override { return ""; }
    FluidType getType() const override { return FluidType::Unknown; }
    
    double conductivity(double T, double P) const override;

private:
    std::string name_;
    std::string reason_;
};

class FluidRegistry {
public:
    // Case-insensitive lookup, nullptr if unknown
    static std::shared_ptr<Fluid> getFluid(const std::string& name);
    static std::vector<std::shared_ptr<Fluid>> getAllFluids();
    
private:
    static std::map<std::string, std::shared_ptr<Fluid>> registry_;
    static bool initialized_;
    static void initialize();
};

/**
 * @brief Thermal conductivity of a registered fluid.
 * 
 * @param fluidName Registry name (case-insensitive)
 * @param T Temperature [K]
 * @param P Pressure [Pa]
 * @return k [W/m-K]
 * @throws std::runtime_error for unknown fluids or failed CoolProp calls
 */
double fluidConductivity(const std::string& fluidName, double T, double P);

// Same lookup with T and P given in any known unit ("25 C", "1 atm")
// @throws std::invalid_argument if either unit is not a temperature/pressure unit
double fluidConductivity(const std::string& fluidName, const Quantity& T, const Quantity& P);

} // namespace heatcond
