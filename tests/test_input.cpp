#include "Input.hpp"
#include "TestSystems.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace
{
nlohmann::json matrixToJson(const Eigen::MatrixXd& M)
{
    nlohmann::json rows = nlohmann::json::array();
    for (Eigen::Index i = 0; i < M.rows(); ++i)
    {
        nlohmann::json row = nlohmann::json::array();
        for (Eigen::Index j = 0; j < M.cols(); ++j) row.push_back(M(i, j));
        rows.push_back(row);
    }
    return rows;
}

nlohmann::json integralDocument(const IntegralSet& integrals)
{
    nlohmann::json doc;
    doc["basis_functions"]   = integrals.basisCount;
    doc["electrons"]         = integrals.electronCount;
    doc["multiplicity"]      = integrals.multiplicity;
    doc["nuclear_repulsion"] = integrals.nuclearEnergy;
    doc["overlap"]           = matrixToJson(integrals.S);
    doc["kinetic"]           = matrixToJson(integrals.T);
    doc["potential"]         = matrixToJson(integrals.V);

    const size_t n = integrals.basisCount;
    nlohmann::json values = nlohmann::json::array();
    for (size_t i = 0; i < n; ++i)
        for (size_t j = 0; j < n; ++j)
            for (size_t k = 0; k < n; ++k)
                for (size_t l = 0; l < n; ++l) values.push_back(integrals.eri(i, j, k, l));
    doc["eri"] = {{"format", "full"}, {"values", values}};

    if (integrals.reference.scfEnergy)
        doc["reference"]["scf_energy"] = *integrals.reference.scfEnergy;
    if (integrals.reference.mp2Energy)
        doc["reference"]["mp2_energy"] = *integrals.reference.mp2Energy;
    return doc;
}

// A directory holding an input file and the integral file it refers to.
class InputFixture : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        directory        = std::filesystem::temp_directory_path() / (std::string("pulayscf_") + info->name());
        std::filesystem::create_directories(directory);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
    }

    void writeIntegrals(const IntegralSet& integrals, const std::string& name = "integrals.json")
    {
        std::ofstream file(directory / name);
        file << integralDocument(integrals).dump(2);
    }

    std::string writeInput(const std::string& contents)
    {
        std::filesystem::path path = directory / "job.in";
        std::ofstream file(path);
        file << contents;
        return path.string();
    }

    std::filesystem::path directory;
};

// Runs the reader and returns the error message, or an empty string if it succeeded.
std::string readError(const std::string& path)
{
    try
    {
        Input(path).read();
    }
    catch (const std::runtime_error& e)
    {
        return e.what();
    }
    return "";
}
} // namespace

TEST_F(InputFixture, ReadsAllBlocks)
{
    IntegralSet h2         = TestSystems::H2();
    h2.reference.scfEnergy = -1.1167;
    writeIntegrals(h2);
    std::string path = writeInput(
        "# H2 test job\n"
        "$integrals\n"
        "  file integrals.json\n"
        "  reference_tol 1e-5\n"
        "$end\n"
        "\n"
        "$SCF\n"
        "  MAX_ITER 75   # comment after an option\n"
        "  energy_tol 1e-9\n"
        "  density_tol 1e-7\n"
        "  diis true\n"
        "  diis_size 6\n"
        "  diis_start 3\n"
        "  diis_tol 1e-7\n"
        "  damp 20\n"
        "  max_damp_cycles 10\n"
        "  stop_damp_thresh 1e-3\n"
        "$end\n"
        "$mp2\n"
        "  os_scale 1.1\n"
        "  ss_scale 0.5\n"
        "$end\n"
    );

    Input input(path);
    Input::InputSettings settings = input.read();

    EXPECT_EQ(settings.integrals.basisCount, 2u);
    EXPECT_DOUBLE_EQ(settings.referenceTol, 1e-5);
    ASSERT_TRUE(settings.integrals.reference.scfEnergy.has_value());
    EXPECT_DOUBLE_EQ(*settings.integrals.reference.scfEnergy, -1.1167);
    EXPECT_FALSE(settings.integrals.reference.mp2Energy.has_value());
    EXPECT_EQ(std::filesystem::path(settings.integralFile).filename().string(), "integrals.json");

    const SCFOptions& scf = settings.scfOptions;
    EXPECT_EQ(scf.maxIter, 75u);
    EXPECT_DOUBLE_EQ(scf.energyTol, 1e-9);
    EXPECT_DOUBLE_EQ(scf.densityTol, 1e-7);
    EXPECT_TRUE(scf.useDIIS);
    EXPECT_EQ(scf.DIISmaxSize, 6u);
    EXPECT_EQ(scf.DIISstart, 3u);
    EXPECT_DOUBLE_EQ(scf.DIISErrorTol, 1e-7);
    EXPECT_EQ(scf.damp, 20);
    EXPECT_EQ(scf.maxDampIter, 10u);
    EXPECT_DOUBLE_EQ(scf.stopDampThresh, 1e-3);
    EXPECT_FALSE(scf.unrestricted);

    ASSERT_TRUE(settings.mp2Options.has_value());
    EXPECT_DOUBLE_EQ(settings.mp2Options->osScale, 1.1);
    EXPECT_DOUBLE_EQ(settings.mp2Options->ssScale, 0.5);
    EXPECT_FALSE(settings.mp2Options->densityFitting);
    EXPECT_TRUE(input.getWarnings().empty());
}

TEST_F(InputFixture, DefaultsFollowTheIntegralFile)
{
    writeIntegrals(TestSystems::H2Cation());
    std::string path = writeInput("$integrals\nfile integrals.json\n$end\n$scf\nmax_iter 40\n$end\n");

    Input::InputSettings settings = Input(path).read();
    EXPECT_TRUE(settings.scfOptions.unrestricted);
    EXPECT_EQ(settings.scfOptions.maxDampIter, 40u);
    EXPECT_FALSE(settings.mp2Options.has_value());
    EXPECT_DOUBLE_EQ(settings.referenceTol, 1e-6);
}

TEST_F(InputFixture, AbsoluteIntegralPath)
{
    writeIntegrals(TestSystems::H2(), "absolute.json");
    std::string path = writeInput("$integrals\nfile " + (directory / "absolute.json").string() + "\n$end\n");

    Input::InputSettings settings = Input(path).read();
    EXPECT_EQ(settings.integralFile, (directory / "absolute.json").string());
}

TEST_F(InputFixture, CollectsAllErrors)
{
    writeIntegrals(TestSystems::H2());
    std::string path = writeInput(
        "$integrals\nfile integrals.json\n$end\n"
        "$scf\nmax_iter 0\nenergy_tol -1\ndamp 150\nguess_mix 3\n$end\n"
    );

    std::string message = readError(path);
    EXPECT_NE(message.find("INPUT ERROR:"), std::string::npos);
    EXPECT_NE(message.find("MAX_ITER"), std::string::npos);
    EXPECT_NE(message.find("ENERGY_TOL"), std::string::npos);
    EXPECT_NE(message.find("DAMP"), std::string::npos);
    EXPECT_NE(message.find("guess_mix"), std::string::npos);
}

TEST_F(InputFixture, UnknownOptionsAndBlocks)
{
    writeIntegrals(TestSystems::H2());
    std::string path = writeInput(
        "$integrals\nfile integrals.json\n$end\n"
        "$scf\nlevel_shift 0.5\n$end\n"
        "$geometry\nH 0 0 0\n$end\n"
    );

    std::string message = readError(path);
    EXPECT_NE(message.find("Unknown option in $scf block: level_shift"), std::string::npos);
    EXPECT_NE(message.find("Unknown block $geometry"), std::string::npos);
}

TEST_F(InputFixture, InvalidValues)
{
    writeIntegrals(TestSystems::H2());
    EXPECT_NE(readError(writeInput("$integrals\nfile integrals.json\n$end\n$scf\ndiis maybe\n$end\n")).find("diis"),
              std::string::npos);
    EXPECT_NE(readError(writeInput("$integrals\nfile integrals.json\n$end\n$scf\nmax_iter many\n$end\n"))
                  .find("max_iter"),
              std::string::npos);
}

TEST_F(InputFixture, MissingIntegrals)
{
    EXPECT_NE(readError(writeInput("$scf\nmax_iter 10\n$end\n")).find("Missing $integrals block"), std::string::npos);
    EXPECT_NE(readError(writeInput("$integrals\nreference_tol 1e-6\n$end\n")).find("integral file"), std::string::npos);
    EXPECT_NE(readError(writeInput("$integrals\nfile nothing_here.json\n$end\n")).find("Could not open integral file"),
              std::string::npos);
    EXPECT_THROW(Input((directory / "missing.in").string()).read(), std::runtime_error);
}

TEST_F(InputFixture, RestrictedOpenShellIsAnError)
{
    writeIntegrals(TestSystems::H2Cation());
    std::string message =
        readError(writeInput("$integrals\nfile integrals.json\n$end\n$scf\nunrestricted false\n$end\n"));
    EXPECT_NE(message.find("restricted (RHF)"), std::string::npos);
}

TEST_F(InputFixture, DensityFittingNeedsIntegrals)
{
    writeIntegrals(TestSystems::H2());
    std::string scfMessage =
        readError(writeInput("$integrals\nfile integrals.json\n$end\n$scf\ndensity_fitting true\n$end\n"));
    EXPECT_NE(scfMessage.find("$scf block requires density-fitting integrals"), std::string::npos);

    std::string mp2Message =
        readError(writeInput("$integrals\nfile integrals.json\n$end\n$mp2\ndensity_fitting true\n$end\n"));
    EXPECT_NE(mp2Message.find("$mp2 block requires density-fitting integrals"), std::string::npos);
}

TEST_F(InputFixture, IneffectiveOptionsWarn)
{
    writeIntegrals(TestSystems::H2());
    std::string path = writeInput(
        "$integrals\nfile integrals.json\nreference_tol 1e-4\n$end\n"
        "$scf\ndiis false\ndiis_size 4\nmax_damp_cycles 3\n$end\n"
    );

    Input input(path);
    Input::InputSettings settings = input.read();
    EXPECT_FALSE(settings.scfOptions.useDIIS);

    const std::vector<std::string>& warnings = input.getWarnings();
    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_NE(warnings[0].find("DIIS_SIZE"), std::string::npos);
    EXPECT_NE(warnings[1].find("MAX_DAMP_CYCLES"), std::string::npos);
    EXPECT_NE(warnings[2].find("REFERENCE_TOL"), std::string::npos);
}

TEST_F(InputFixture, NegativeCountsAreErrors)
{
    writeIntegrals(TestSystems::H2());
    std::string message =
        readError(writeInput("$integrals\nfile integrals.json\n$end\n$scf\nmax_iter -1\ndiis_size -3\n$end\n"));
    EXPECT_NE(message.find("max_iter in $scf block must be non-negative: -1"), std::string::npos);
    EXPECT_NE(message.find("diis_size in $scf block must be non-negative: -3"), std::string::npos);
}
