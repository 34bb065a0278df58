#include "heatcond/fluids.h"
#include "CoolProp.h"
#include "CoolPropLib.h"  // For set_config_bool C-style API
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace heatcond {

void applyCoolPropConfig(const CoolPropConfig& config) {
    // Must be called before any CoolProp fluid initialization
    ::set_config_bool("ENABLE_SUPERANCILLARIES", config.enableSuperancillaries);
}

double Fluid::conductivity(double T, double P) const {
    double k = CoolProp::PropsSI("L", "T", T, "P", P, getCoolPropName());
    if (!std::isfinite(k)) {
        std::ostringstream msg;
        msg << "CoolProp could not evaluate conductivity of " << getName()
            << " at T=" << T << " K, P=" << P << " Pa";
        std::string err = CoolProp::get_global_param_string("errstring");
        if (!err.empty()) msg << ": " << err;
        throw std::runtime_error(msg.str());
    }
    return k;
}

double UnsupportedFluid::conductivity(double, double) const {
    throw std::runtime_error("Fluid " + name_ + " is not supported: " + reason_);
}

std::map<std::string, std::shared_ptr<Fluid>> FluidRegistry::registry_;
bool FluidRegistry::initialized_ = false;

static std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

void FluidRegistry::initialize() {
    if (initialized_) return;
    initialized_ = true;
    
    // Registry keys are lowercase; getName() keeps the display spelling
    auto add = [](std::shared_ptr<Fluid> fluid) {
        registry_[toLower(fluid->getName())] = fluid;
    };
    auto addReal = [&add](const std::string& name, const std::string& cpName) {
        add(std::make_shared<RealFluid>(name, cpName));
    };
    auto addIdeal = [&add](const std::string& name, const std::string& cpName) {
        add(std::make_shared<IdealGasFluid>(name, cpName));
    };
    auto addIncomp = [&add](const std::string& name) {
        add(std::make_shared<IncompressibleFluid>(name));
    };
    auto addUnsupported = [&add](const std::string& name, const std::string& reason) {
        add(std::make_shared<UnsupportedFluid>(name, reason));
    };
    
    // --- Real Fluids ---
    addReal("Water", "Water");
    addReal("Steam", "Water");
    addReal("R718", "Water");
    addReal("HeavyWater", "HeavyWater");
    addReal("Ammonia", "Ammonia");
    addReal("R717", "Ammonia");
    addReal("CarbonDioxide", "CarbonDioxide");
    addReal("R744", "CarbonDioxide");
    addReal("Nitrogen", "Nitrogen");
    addReal("Oxygen", "Oxygen");
    addReal("Argon", "Argon");
    addReal("Helium", "Helium");
    addReal("Hydrogen", "Hydrogen");
    addReal("Methane", "Methane");
    addReal("Ethane", "Ethane");
    addReal("Propane", "Propane");
    addReal("R290", "Propane");
    addReal("n-Butane", "n-Butane");
    addReal("IsoButane", "IsoButane");
    addReal("R600a", "IsoButane");
    addReal("Toluene", "Toluene");
    addReal("R134a", "R134a");
    addReal("R32", "R32");
    addReal("R1234yf", "R1234yf");
    addReal("R1234ze(E)", "R1234ze(E)");
    addReal("R245fa", "R245fa");
    
    // --- Gas aliases ---
    addIdeal("Air", "Air");
    addIdeal("N2", "Nitrogen");
    addIdeal("O2", "Oxygen");
    addIdeal("H2", "Hydrogen");
    addIdeal("He", "Helium");
    addIdeal("Ar", "Argon");
    addIdeal("CO2", "CarbonDioxide");
    addIdeal("CH4", "Methane");
    
    // --- Incompressible heat transfer fluids (pure, no concentration) ---
    addIncomp("T66");
    addIncomp("T72");
    addIncomp("DowQ");
    addIncomp("DowJ");
    addIncomp("XLT");
    addIncomp("NaK");
    
    // --- Solids have no CoolProp transport model ---
    addUnsupported("Aluminum", "Solid conductivity is not available from CoolProp");
    addUnsupported("Copper", "Solid conductivity is not available from CoolProp");
    addUnsupported("Steel", "Solid conductivity is not available from CoolProp");
}

std::shared_ptr<Fluid> FluidRegistry::getFluid(const std::string& name) {
    if (!initialized_) initialize();
    
    auto it = registry_.find(toLower(name));
    if (it != registry_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::shared_ptr<Fluid>> FluidRegistry::getAllFluids() {
    if (!initialized_) initialize();
    std::vector<std::shared_ptr<Fluid>> fluids;
    fluids.reserve(registry_.size());
    for (const auto& [name, fluid] : registry_) {
        fluids.push_back(fluid);
    }
    return fluids;
}

double fluidConductivity(const std::string& fluidName, double T, double P) {
    auto fluid = FluidRegistry::getFluid(fluidName);
    if (!fluid) {
        throw std::runtime_error("Unknown fluid: " + fluidName);
    }
    return fluid->conductivity(T, P);
}

double fluidConductivity(const std::string& fluidName, const Quantity& T, const Quantity& P) {
    double T_K = UnitConverter::quantityToSI(T, UnitType::Temperature, "T");
    double P_Pa = UnitConverter::quantityToSI(P, UnitType::Pressure, "P");
    return fluidConductivity(fluidName, T_K, P_Pa);
}

} // namespace heatcond
