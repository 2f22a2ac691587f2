#pragma once
#include "Integrals.hpp"
#include "MP2.hpp"
#include "SCF.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Reader for the plain-text input file.
 *
 * The file consists of $integrals, $scf and $mp2 blocks, each closed by $end. Keys are case-insensitive and '#'
 * starts a comment. The integral file named in the $integrals block is read as part of Input::read().
 */
class Input
{
  public:
    Input(const std::string& filename);

    struct InputSettings
    {
        IntegralSet integrals;
        SCFOptions scfOptions;
        std::optional<MP2Options> mp2Options; // Set if the input has a $mp2 block
        double referenceTol;
        std::string integralFile; // Resolved path of the integral file
    };

    /**
     * Parses the input file and loads the integral file it refers to.
     *
     * @throws std::runtime_error with every problem found ("INPUT ERROR:" followed by one line per problem), or if
     *         a file cannot be read.
     */
    InputSettings read();

    const std::vector<std::string>& getWarnings() const;

  private:
    std::string filename;
    std::vector<std::string> warnings;

    enum OptionName : size_t
    {
        MAX_ITER,
        ENERGY_TOL,
        DENSITY_TOL,
        DIIS,
        DIIS_MAX_SIZE,
        DIIS_START,
        DIIS_ERROR_TOL,
        UNRESTRICTED,
        GUESS_MIX,
        DAMP,
        MAX_DAMP_CYCLES,
        STOP_DAMP_THRESH,
        SCF_DENSITY_FITTING,
        COUNT // number of options
    };

    enum MP2OptionName : size_t
    {
        MP2_DENSITY_FITTING,
        OS_SCALE,
        SS_SCALE,
        MP2_COUNT
    };

    struct IntegralsInputSettings
    {
        std::string file;
        double referenceTol = 1.0e-6;
        bool referenceTolSet = false;
    };

    struct SCFInputSettings
    {
        SCFOptions scfOptions;
        std::array<bool, Input::COUNT> optionsSet {};
    };

    struct MP2InputSettings
    {
        bool requested = false;
        MP2Options mp2Options;
        std::array<bool, Input::MP2_COUNT> optionsSet {};
    };

    static IntegralsInputSettings parseIntegralsBlock(const std::string& integralsBlock, std::vector<std::string>& errors);
    static SCFInputSettings parseSCFBlock(const std::string& SCFBlock, std::vector<std::string>& errors);
    static MP2InputSettings parseMP2Block(const std::string& MP2Block, std::vector<std::string>& errors);
    static void validateSettings(
        const IntegralSet& integrals,
        const IntegralsInputSettings& integralsSettings,
        const SCFInputSettings& scfSettings,
        const MP2InputSettings& mp2Settings,
        std::vector<std::string>& warnings
    );
    static void throwIfErrors(const std::vector<std::string>& errors);
};
