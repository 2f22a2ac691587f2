#include "Input.hpp"

#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace
{
// Reads the value following an option. On failure, records an error and returns false. Unsigned options reject
// negative values.
template <typename T>
bool readValue(std::istringstream& stream, T& value, const std::string& token, const std::string& block, std::vector<std::string>& errors)
{
    if constexpr (std::is_unsigned_v<T>)
    {
        long long signedValue = 0;
        stream >> signedValue;
        if (!stream.fail() && signedValue < 0)
        {
            errors.emplace_back(
                "Value for option " + token + " in " + block + " block must be non-negative: " + std::to_string(signedValue)
            );
            return true;
        }
        if (!stream.fail())
            value = static_cast<T>(signedValue);
    }
    else
    {
        stream >> value;
    }

    if (stream.fail())
    {
        errors.emplace_back("Error reading value for option " + token + " in " + block + " block.");
        return false;
    }
    return true;
}

bool readBool(std::istringstream& stream, bool& value, const std::string& token, const std::string& block, std::vector<std::string>& errors)
{
    std::string boolStr;
    if (!readValue(stream, boolStr, token, block, errors))
        return false;
    if (!Utils::parseBool(boolStr, value))
    {
        errors.emplace_back("Invalid boolean value for " + token + " in " + block + " block: " + boolStr);
    }
    return true;
}
} // namespace

Input::Input(const std::string& filename) : filename(filename) {}

const std::vector<std::string>& Input::getWarnings() const
{
    return this->warnings;
}

Input::InputSettings Input::read()
{
    this->warnings.clear();

    std::ifstream inputFile(this->filename);
    if (!inputFile.is_open())
    {
        throw std::runtime_error("Could not open input file: " + filename);
    }

    // Flags
    bool inIntegralsBlock = false;
    bool inSCFBlock       = false;
    bool inMP2Block       = false;
    bool hasIntegralsBlock = false;
    bool hasMP2Block       = false;

    // Input blocks
    std::stringstream integralsBlock;
    std::stringstream SCFBlock;
    std::stringstream MP2Block;

    std::vector<std::string> errors;

    // Remove empty lines and comments, seperate into the blocks.
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(inputFile, line))
    {
        std::istringstream iss(line);
        std::string token;

        ++lineNumber;

        while (iss >> token)
        {
            std::string lwrToken = Utils::toLowerString(token);
            if (token[0] == '#') // Comment
                break;

            if (lwrToken == "$integrals")
            {
                inIntegralsBlock  = true;
                hasIntegralsBlock = true;
                continue;
            }
            else if (lwrToken == "$scf")
            {
                inSCFBlock = true;
                continue;
            }
            else if (lwrToken == "$mp2")
            {
                inMP2Block  = true;
                hasMP2Block = true;
                continue;
            }
            else if (lwrToken == "$end")
            {
                inIntegralsBlock = false;
                inSCFBlock       = false;
                inMP2Block       = false;
                continue;
            }
            else if (lwrToken[0] == '$')
            {
                errors.emplace_back("Unknown block " + token + " at line " + std::to_string(lineNumber) + ".");
                break;
            }
            else if (inIntegralsBlock)
            {
                integralsBlock << token << " ";
            }
            else if (inSCFBlock)
            {
                SCFBlock << token << " ";
            }
            else if (inMP2Block)
            {
                MP2Block << token << " ";
            }
            else
            {
                errors.emplace_back("Unexpected token at line " + std::to_string(lineNumber) + ": " + token);
            }
        }
    }
    inputFile.close();

    if (!hasIntegralsBlock)
        errors.emplace_back("Missing $integrals block.");

    IntegralsInputSettings integralsSettings = parseIntegralsBlock(integralsBlock.str(), errors);
    SCFInputSettings scfInputSettings        = parseSCFBlock(SCFBlock.str(), errors);
    MP2InputSettings mp2InputSettings        = parseMP2Block(MP2Block.str(), errors);
    mp2InputSettings.requested               = hasMP2Block;

    if (hasIntegralsBlock && integralsSettings.file.empty())
        errors.emplace_back("The $integrals block must name the integral file (file <path>).");

    // Nothing below is meaningful if the input itself is malformed.
    throwIfErrors(errors);

    // Relative integral paths are taken relative to the input file.
    std::filesystem::path integralPath(integralsSettings.file);
    if (integralPath.is_relative())
        integralPath = std::filesystem::path(this->filename).parent_path() / integralPath;

    IntegralSet integrals = readIntegralFile(integralPath.string());

    validateSettings(integrals, integralsSettings, scfInputSettings, mp2InputSettings, this->warnings);

    SCFOptions options = scfInputSettings.scfOptions;
    if (!scfInputSettings.optionsSet[UNRESTRICTED])
    {
        options.unrestricted = integrals.multiplicity != 1;
    }

    if (!scfInputSettings.optionsSet[MAX_DAMP_CYCLES])
    {
        options.maxDampIter = options.maxIter;
    }

    std::optional<MP2Options> mp2Options;
    if (mp2InputSettings.requested)
        mp2Options = mp2InputSettings.mp2Options;

    return {
        .integrals    = std::move(integrals),
        .scfOptions   = options,
        .mp2Options   = mp2Options,
        .referenceTol = integralsSettings.referenceTol,
        .integralFile = integralPath.string(),
    };
}

Input::IntegralsInputSettings Input::parseIntegralsBlock(const std::string& integralsBlock, std::vector<std::string>& errors)
{
    IntegralsInputSettings settings;

    std::istringstream integralsStream(integralsBlock);
    std::string token;
    while (integralsStream >> token)
    {
        std::string tokenLwr = Utils::toLowerString(token);
        bool ok              = true;
        if (tokenLwr == "file")
        {
            ok = readValue(integralsStream, settings.file, token, "$integrals", errors);
        }
        else if (tokenLwr == "reference_tol")
        {
            ok                       = readValue(integralsStream, settings.referenceTol, token, "$integrals", errors);
            settings.referenceTolSet = true;
        }
        else
        {
            errors.emplace_back("Unknown option in $integrals block: " + token);
        }

        if (!ok)
            break;
    }

    return settings;
}

Input::SCFInputSettings Input::parseSCFBlock(const std::string& SCFBlock, std::vector<std::string>& errors)
{
    Input::SCFInputSettings settings;
    SCFOptions& options = settings.scfOptions;

    std::istringstream SCFStream(SCFBlock);
    std::string token;
    while (SCFStream >> token)
    {
        std::string tokenLwr = Utils::toLowerString(token);
        bool ok              = true;
        if (tokenLwr == "max_iter")
        {
            ok                            = readValue(SCFStream, options.maxIter, token, "$scf", errors);
            settings.optionsSet[MAX_ITER] = true;
        }
        else if (tokenLwr == "energy_tol")
        {
            ok                              = readValue(SCFStream, options.energyTol, token, "$scf", errors);
            settings.optionsSet[ENERGY_TOL] = true;
        }
        else if (tokenLwr == "density_tol")
        {
            ok                               = readValue(SCFStream, options.densityTol, token, "$scf", errors);
            settings.optionsSet[DENSITY_TOL] = true;
        }
        else if (tokenLwr == "diis")
        {
            ok                        = readBool(SCFStream, options.useDIIS, token, "$scf", errors);
            settings.optionsSet[DIIS] = true;
        }
        else if (tokenLwr == "diis_size")
        {
            ok                                 = readValue(SCFStream, options.DIISmaxSize, token, "$scf", errors);
            settings.optionsSet[DIIS_MAX_SIZE] = true;
        }
        else if (tokenLwr == "diis_start")
        {
            ok                              = readValue(SCFStream, options.DIISstart, token, "$scf", errors);
            settings.optionsSet[DIIS_START] = true;
        }
        else if (tokenLwr == "diis_tol")
        {
            ok                                  = readValue(SCFStream, options.DIISErrorTol, token, "$scf", errors);
            settings.optionsSet[DIIS_ERROR_TOL] = true;
        }
        else if (tokenLwr == "unrestricted")
        {
            ok                                = readBool(SCFStream, options.unrestricted, token, "$scf", errors);
            settings.optionsSet[UNRESTRICTED] = true;
        }
        else if (tokenLwr == "guess_mix")
        {
            std::string mixStr;
            ok = readValue(SCFStream, mixStr, token, "$scf", errors);
            if (ok && Utils::toLowerString(mixStr) == "true")
                options.guessMix = 1;
            else if (ok && Utils::toLowerString(mixStr) == "false")
                options.guessMix = 0;
            else if (ok && !mixStr.empty() && std::ranges::all_of(mixStr, ::isdigit) && mixStr.size() < 4)
                options.guessMix = std::stoi(mixStr);
            else if (ok)
                errors.emplace_back(
                    "Invalid value for " + token + " in $scf block: \"" + mixStr + "\". Must be an integer between 0 and 10."
                );
            settings.optionsSet[GUESS_MIX] = true;
        }
        else if (tokenLwr == "damp")
        {
            ok                        = readValue(SCFStream, options.damp, token, "$scf", errors);
            settings.optionsSet[DAMP] = true;
        }
        else if (tokenLwr == "max_damp_cycles")
        {
            ok                                   = readValue(SCFStream, options.maxDampIter, token, "$scf", errors);
            settings.optionsSet[MAX_DAMP_CYCLES] = true;
        }
        else if (tokenLwr == "stop_damp_thresh")
        {
            ok                                    = readValue(SCFStream, options.stopDampThresh, token, "$scf", errors);
            settings.optionsSet[STOP_DAMP_THRESH] = true;
        }
        else if (tokenLwr == "density_fitting")
        {
            ok                                       = readBool(SCFStream, options.densityFitting, token, "$scf", errors);
            settings.optionsSet[SCF_DENSITY_FITTING] = true;
        }
        else
        {
            errors.emplace_back("Unknown option in $scf block: " + token);
        }

        // The stream cannot be trusted after a failed read.
        if (!ok)
            break;
    }

    return settings;
}

Input::MP2InputSettings Input::parseMP2Block(const std::string& MP2Block, std::vector<std::string>& errors)
{
    Input::MP2InputSettings settings;
    MP2Options& options = settings.mp2Options;

    std::istringstream MP2Stream(MP2Block);
    std::string token;
    while (MP2Stream >> token)
    {
        std::string tokenLwr = Utils::toLowerString(token);
        bool ok              = true;
        if (tokenLwr == "density_fitting")
        {
            ok                                       = readBool(MP2Stream, options.densityFitting, token, "$mp2", errors);
            settings.optionsSet[MP2_DENSITY_FITTING] = true;
        }
        else if (tokenLwr == "os_scale")
        {
            ok                            = readValue(MP2Stream, options.osScale, token, "$mp2", errors);
            settings.optionsSet[OS_SCALE] = true;
        }
        else if (tokenLwr == "ss_scale")
        {
            ok                            = readValue(MP2Stream, options.ssScale, token, "$mp2", errors);
            settings.optionsSet[SS_SCALE] = true;
        }
        else
        {
            errors.emplace_back("Unknown option in $mp2 block: " + token);
        }

        if (!ok)
            break;
    }

    return settings;
}

void Input::validateSettings(
    const IntegralSet& integrals,
    const IntegralsInputSettings& integralsSettings,
    const SCFInputSettings& scfSettings,
    const MP2InputSettings& mp2Settings,
    std::vector<std::string>& warnings
)
{
    std::vector<std::string> errors;
    const SCFOptions& scfOptions = scfSettings.scfOptions;

    if (integralsSettings.referenceTolSet && integralsSettings.referenceTol < 0)
        errors.emplace_back("REFERENCE_TOL in $integrals block must be non-negative.");

    if (scfSettings.optionsSet[MAX_ITER] && scfOptions.maxIter == 0)
        errors.emplace_back("MAX_ITER in $scf block must be greater than 0.");

    if (scfSettings.optionsSet[ENERGY_TOL] && scfOptions.energyTol < 0)
        errors.emplace_back("ENERGY_TOL in $scf block must be non-negative.");

    if (scfSettings.optionsSet[DENSITY_TOL] && scfOptions.densityTol < 0)
        errors.emplace_back("DENSITY_TOL in $scf block must be non-negative.");

    if (scfSettings.optionsSet[DIIS_START] && scfOptions.DIISstart < 1)
        errors.emplace_back("DIIS_START in $scf block must be greater than 0.");

    if (scfSettings.optionsSet[DIIS_ERROR_TOL] && scfOptions.DIISErrorTol < 0)
        errors.emplace_back("DIIS_TOL in $scf block must be non-negative.");

    if (scfSettings.optionsSet[GUESS_MIX] && (scfOptions.guessMix < 0 || scfOptions.guessMix > 10))
        errors.emplace_back("GUESS_MIX in $scf block must be between 0 and 10.");

    if (scfSettings.optionsSet[DAMP] && (scfOptions.damp < 0 || scfOptions.damp > 100))
        errors.emplace_back("DAMP in $scf block must be between 0 and 100.");

    if (scfSettings.optionsSet[MAX_DAMP_CYCLES] && scfOptions.maxDampIter == 0)
        errors.emplace_back("MAX_DAMP_CYCLES in $scf block must be a positive integer.");

    if (scfSettings.optionsSet[STOP_DAMP_THRESH] && scfOptions.stopDampThresh < 0)
        errors.emplace_back("STOP_DAMP_THRESH in $scf block must be non-negative.");

    bool unrestricted = scfOptions.unrestricted;
    if (!scfSettings.optionsSet[UNRESTRICTED])
    {
        unrestricted = (integrals.multiplicity != 1);
    }

    if (scfSettings.optionsSet[UNRESTRICTED] && !scfOptions.unrestricted && integrals.multiplicity != 1)
    {
        errors.emplace_back(
            "Multiplicity in the integral file is " + std::to_string(integrals.multiplicity)
            + " but the SCF method is restricted (RHF). Use the unrestricted (UHF) method."
        );
    }

    if (scfOptions.guessMix > 0 && !unrestricted)
        errors.emplace_back("The guess_mix option can only be used with unrestricted calculations.");

    if (scfOptions.densityFitting && !integrals.densityFitting)
        errors.emplace_back("DENSITY_FITTING in $scf block requires density-fitting integrals in the integral file.");

    if (mp2Settings.requested && mp2Settings.mp2Options.densityFitting && !integrals.densityFitting)
        errors.emplace_back("DENSITY_FITTING in $mp2 block requires density-fitting integrals in the integral file.");

    // --- Warnings ---
    if (scfSettings.optionsSet[DIIS_MAX_SIZE] && !scfOptions.useDIIS)
        warnings.emplace_back("DIIS_SIZE is set, but it will have no effect because diis is disabled.");
    if (scfSettings.optionsSet[DIIS_START] && !scfOptions.useDIIS)
        warnings.emplace_back("DIIS_START is set, but it will have no effect because diis is disabled.");
    if (scfSettings.optionsSet[DIIS_ERROR_TOL] && !scfOptions.useDIIS)
        warnings.emplace_back("DIIS_TOL is set, but it will have no effect because diis is disabled.");
    if (scfSettings.optionsSet[MAX_DAMP_CYCLES] && scfOptions.damp == 0)
        warnings.emplace_back("MAX_DAMP_CYCLES is set, but it will have no effect because damping is off.");
    if (scfSettings.optionsSet[STOP_DAMP_THRESH] && scfOptions.damp == 0)
        warnings.emplace_back("STOP_DAMP_THRESH is set, but it will have no effect because damping is off.");
    if (integralsSettings.referenceTolSet && !integrals.reference.scfEnergy && !integrals.reference.mp2Energy)
        warnings.emplace_back("REFERENCE_TOL is set, but the integral file has no reference energies.");
    if (mp2Settings.requested && integrals.occupiedCountBeta() == 0 && integrals.occupiedCountAlpha() <= 1)
        warnings.emplace_back("MP2 was requested for a one-electron system; the correlation energy is zero.");

    throwIfErrors(errors);
}

void Input::throwIfErrors(const std::vector<std::string>& errors)
{
    if (!errors.empty())
    {
        std::string errorMessage = "INPUT ERROR:\n";
        for (const auto& error : errors) { errorMessage += "- " + error + "\n"; }
        throw std::runtime_error(errorMessage);
    }
}
