#include "heatcond/calculator.h"
#include "heatcond/fluids.h"
#include "heatcond/units.h"
#include <iostream>
#include <fstream>
#include <string>
#include <filesystem>
#include <map>
#include <vector>

namespace fs = std::filesystem;

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <formula> [name=value[unit] ...]\n\n";
    std::cerr << "Example: " << programName << " R_cylinder Di=0.9 Do=1.0 k=20 L=10\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --list              List available formulas, their inputs and unit constants\n";
    std::cerr << "  -c, --config <file>     Options file (default: ./heatcond.conf if present)\n";
    std::cerr << "  -f, --format <format>   Output format: text, json (default: text)\n";
    std::cerr << "  -o, --output <file>     Output file (default: stdout)\n";
    std::cerr << "  --si                    R-values in m^2-K/W-in (default)\n";
    std::cerr << "  --imperial              R-values in ft^2-F-hr/BTU-in\n";
    std::cerr << "  --no-validate           Skip input range checks\n";
    std::cerr << "  --fluid <name>          Take k from CoolProp for this fluid\n";
    std::cerr << "  --T <value[unit]>       Fluid temperature (default: 300 K)\n";
    std::cerr << "  --P <value[unit]>       Fluid pressure (default: 101325 Pa)\n";
    std::cerr << "  --no-superancillary     Disable CoolProp superancillary functions\n";
    std::cerr << "  -v, --verbose           Trace evaluation on stderr\n";
    std::cerr << "  -h, --help              Show this help message\n";
}

int main(int argc, char* argv[]) {
    std::string configFile;
    std::string outputFile;
    std::string formula;
    std::string fluidT = "300 K";
    std::string fluidP = "101325 Pa";
    std::vector<std::string> assignments;

    // Command line flags override the options file, so keep them aside
    std::string formatArg;
    std::string fluidArg;
    int siArg = -1;
    bool noValidate = false;
    bool noSuperancillary = false;
    bool verbose = false;
    bool listFormulas = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-l" || arg == "--list") {
            listFormulas = true;
        } else if (arg == "--si") {
            siArg = 1;
        } else if (arg == "--imperial") {
            siArg = 0;
        } else if (arg == "--no-validate") {
            noValidate = true;
        } else if (arg == "--no-superancillary") {
            noSuperancillary = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-c" || arg == "--config" || arg == "-f" || arg == "--format" ||
                   arg == "-o" || arg == "--output" || arg == "--fluid" ||
                   arg == "--T" || arg == "--P") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument\n";
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "-c" || arg == "--config") configFile = value;
            else if (arg == "-f" || arg == "--format") formatArg = value;
            else if (arg == "-o" || arg == "--output") outputFile = value;
            else if (arg == "--fluid") fluidArg = value;
            else if (arg == "--T") fluidT = value;
            else fluidP = value;
        } else if (arg[0] != '-' && formula.empty() && arg.find('=') == std::string::npos) {
            formula = arg;
        } else if (arg.find('=') != std::string::npos) {
            assignments.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (listFormulas) {
        std::cout << heatcond::generateFormulaList();
        std::cout << "\nConstants:\n" << heatcond::generateConstantsList();
        return 0;
    }

    if (formula.empty()) {
        std::cerr << "Error: No formula specified\n";
        printUsage(argv[0]);
        return 1;
    }

    // Options file first, then command line overrides
    heatcond::CalculatorOptions options;
    if (!configFile.empty()) {
        if (!heatcond::loadCalculatorOptionsFromFile(configFile, options)) {
            std::cerr << "Error: Could not read config file: " << configFile << "\n";
            return 1;
        }
    } else if (fs::exists("heatcond.conf")) {
        heatcond::loadCalculatorOptionsFromFile("heatcond.conf", options);
    }
    if (!formatArg.empty()) {
        auto format = heatcond::parseFormat(formatArg);
        if (!format) {
            std::cerr << "Unknown format: " << formatArg << "\n";
            return 1;
        }
        options.format = *format;
    }
    if (!fluidArg.empty()) options.fluid = fluidArg;
    if (siArg >= 0) options.SI = (siArg == 1);
    if (noValidate) options.validateInputs = false;
    if (noSuperancillary) options.enableSuperancillaries = false;
    if (verbose) options.verbose = true;

    if (options.format != "text" && options.format != "json") {
        std::cerr << "Unknown format: " << options.format << "\n";
        return 1;
    }

    // Collect inputs; SI=... selects the unit system instead of being an input
    std::map<std::string, heatcond::Quantity> inputs;
    for (const auto& text : assignments) {
        std::string name = text.substr(0, text.find('='));
        if (name == "SI") {
            auto si = heatcond::parseBool(text.substr(text.find('=') + 1));
            if (!si) {
                std::cerr << "Error: SI expects true or false: " << text << "\n";
                return 1;
            }
            options.SI = *si;
            continue;
        }
        try {
            auto [inputName, quantity] = heatcond::parseAssignment(text);
            inputs[inputName] = quantity;
        } catch (const std::logic_error& e) {
            // invalid_argument for malformed text, out_of_range for overflow
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    // Conductivity from a fluid state when the formula needs k and none was given
    const auto* info = heatcond::FormulaRegistry::find(formula);
    if (info && info->findInput("k") && inputs.find("k") == inputs.end() && !options.fluid.empty()) {
        heatcond::CoolPropConfig cpConfig;
        cpConfig.enableSuperancillaries = options.enableSuperancillaries;
        heatcond::applyCoolPropConfig(cpConfig);
        try {
            double k = heatcond::fluidConductivity(options.fluid, heatcond::parseQuantity(fluidT),
                                                   heatcond::parseQuantity(fluidP));
            if (options.verbose) {
                std::cerr << "[heatcond] k(" << options.fluid << ", T=" << fluidT << ", P=" << fluidP
                          << ") = " << k << " W/m-K\n";
            }
            inputs["k"] = heatcond::Quantity{k, ""};
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    heatcond::Calculator calculator(options);
    auto result = calculator.evaluate(formula, inputs);

    std::string output;
    if (options.format == "json") {
        output = heatcond::generateResultJSON(result) + "\n";
    } else {
        output = heatcond::generateResultText(result, options.precision);
    }

    if (!outputFile.empty()) {
        std::ofstream file(outputFile);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open output file: " << outputFile << "\n";
            return 1;
        }
        file << output;
    } else if (result.success || options.format == "json") {
        std::cout << output;
    } else {
        std::cerr << output;
    }

    return result.success ? 0 : 1;
}
