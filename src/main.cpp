#include "Input.hpp"
#include "MP2.hpp"
#include "Output.hpp"
#include "SCF.hpp"
#include "Utils.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    if (argc != 3)
    {
        std::cerr << "Usage: " << argv[0] << " <input_file> <output_file>\n";
        return 1;
    }

    std::string inputFile  = argv[1];
    std::string outputFile = argv[2];

    Input input(inputFile);
    std::shared_ptr<Output> output;

    try
    {
        output = std::make_shared<Output>(outputFile);

        // Write the user input to the output file.
        std::ifstream inputContents(inputFile);
        if (!inputContents.is_open())
        {
            throw std::runtime_error("Could not open input file: " + inputFile);
        }
        output->writeSeperator();
        output->write("User Input:\n");
        output->writeSeperator();
        std::string inputString((std::istreambuf_iterator<char>(inputContents)), std::istreambuf_iterator<char>());
        while (!inputString.empty() && inputString.front() == '\n') inputString.erase(0, 1); // Remove leading newlines
        while (!inputString.empty() && inputString.back() == '\n') inputString.pop_back();   // Remove trailing newlines
        output->write(inputString + "\n");
        inputContents.close();
        output->writeSeperator();
        output->write("\n");

        const auto [integrals, scfOptions, mp2Options, referenceTol, integralFile] = input.read();
        output->write("Integrals read from: " + integralFile + "\n\n");

        // Write any warnings to the output file.
        const std::vector<std::string>& warnings = input.getWarnings();
        if (!warnings.empty())
        {
            for (const auto& warning : warnings) { output->write("WARNING: " + warning + "\n"); }
            output->write("\n");
        }

        // Run the SCF procedure.
        SCF scf(integrals, scfOptions, output);
        const SCFResults scfResults = scf.run();

        std::vector<EnergyComparison> comparisons;
        if (integrals.reference.scfEnergy)
        {
            comparisons.push_back(
                compareEnergy("SCF energy", scfResults.totalEnergy, *integrals.reference.scfEnergy, referenceTol)
            );
        }

        if (mp2Options)
        {
            MP2 mp2(scfResults, integrals, *mp2Options, output);
            const MP2Results mp2Results = mp2.run();
            if (integrals.reference.mp2Energy)
            {
                comparisons.push_back(
                    compareEnergy("MP2 energy", mp2Results.totalEnergy, *integrals.reference.mp2Energy, referenceTol)
                );
            }
        }

        if (!comparisons.empty())
        {
            output->writeBanner("Comparison with reference energies");
            bool allPassed = true;
            for (const auto& comparison : comparisons)
            {
                output->write(formatComparison(comparison));
                allPassed = allPassed && comparison.passed;
            }
            output->writeSeperator();
            if (!allPassed)
            {
                std::cerr << "Error: computed energies do not match the reference energies.\n";
                return 1;
            }
        }
    }
    catch (const std::exception& e)
    {
        // Write any errors to the output file, and print them to the console.
        std::cerr << "Error: " << e.what() << std::endl;
        if (output)
            output->write("Error: " + std::string(e.what()) + "\n");
        return 1;
    }

    return 0;
}
