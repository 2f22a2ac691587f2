#include "Output.hpp"
#include "SCF.hpp"
#include "TestSystems.hpp"
#include "Utils.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <numbers>
#include <stdexcept>
#include <string>

namespace
{
// Closed-shell energy of a two-function system with the single occupied orbital X (cos t, sin t).
double closedShellEnergy(const IntegralSet& integrals, const Eigen::MatrixXd& X, double t)
{
    Eigen::Vector2d angle(std::cos(t), std::sin(t));
    Eigen::VectorXd c   = X * angle;
    Eigen::MatrixXd h   = integrals.T + integrals.V;
    const double hcc    = c.dot(h * c);
    const double cccc   = TestSystems::moIntegral(integrals.eri, c, c, c, c);
    return 2.0 * hcc + cccc + integrals.nuclearEnergy;
}

// Lowest closed-shell energy of a two-function system, by a scan followed by ternary refinement.
double variationalMinimum(const IntegralSet& integrals)
{
    const Eigen::MatrixXd X = inverseSqrtMatrix(integrals.S);
    const int points        = 2000;
    double best             = 0.0;
    double bestEnergy       = closedShellEnergy(integrals, X, 0.0);
    for (int k = 1; k < points; ++k)
    {
        double t = std::numbers::pi * k / points;
        double e = closedShellEnergy(integrals, X, t);
        if (e < bestEnergy)
        {
            bestEnergy = e;
            best       = t;
        }
    }

    double lo = best - std::numbers::pi / points;
    double hi = best + std::numbers::pi / points;
    for (int k = 0; k < 200; ++k)
    {
        double m1 = lo + (hi - lo) / 3.0;
        double m2 = hi - (hi - lo) / 3.0;
        if (closedShellEnergy(integrals, X, m1) < closedShellEnergy(integrals, X, m2))
            hi = m2;
        else
            lo = m1;
    }
    return closedShellEnergy(integrals, X, 0.5 * (lo + hi));
}

// Closed-form RHF energy of minimal-basis H2, where symmetry fixes the orbital to (phi1 + phi2) / sqrt(2 (1 + S)).
double h2ClosedForm(const IntegralSet& integrals)
{
    const double S12 = integrals.S(0, 1);
    Eigen::VectorXd g(2);
    g << 1.0, 1.0;
    g /= std::sqrt(2.0 * (1.0 + S12));

    Eigen::MatrixXd h = integrals.T + integrals.V;
    return 2.0 * g.dot(h * g) + TestSystems::moIntegral(integrals.eri, g, g, g, g) + integrals.nuclearEnergy;
}

SCFOptions tightOptions()
{
    SCFOptions options;
    options.maxIter      = 100;
    options.energyTol    = 1e-10;
    options.densityTol   = 1e-8;
    options.DIISErrorTol = 1e-8;
    options.maxDampIter  = options.maxIter;
    return options;
}
} // namespace

TEST(SCFTest, RestrictedH2MatchesClosedForm)
{
    TestSystems::ScratchOutput output("rhf_h2");
    const IntegralSet h2 = TestSystems::H2();

    SCF scf(h2, tightOptions(), output.get());
    SCFResults results = scf.run();

    ASSERT_TRUE(results.converged);
    EXPECT_FALSE(results.unrestricted);
    EXPECT_NEAR(results.totalEnergy, h2ClosedForm(h2), 1e-8);
    EXPECT_NEAR(results.totalEnergy, -1.1167, 1e-3);
    EXPECT_NEAR(results.totalEnergy, results.electronicEnergy + results.nuclearEnergy, 1e-14);
    EXPECT_EQ(results.occupiedCountAlpha, 1u);
    EXPECT_DOUBLE_EQ(results.spinSquared, 0.0);

    // Orbitals are S-orthonormal and the density holds one electron per spin.
    Eigen::MatrixXd CtSC = results.C_alpha.transpose() * h2.S * results.C_alpha;
    EXPECT_TRUE(CtSC.isApprox(Eigen::MatrixXd::Identity(2, 2), 1e-10));
    EXPECT_NEAR((results.D_alpha * h2.S).trace(), 1.0, 1e-10);
    EXPECT_LT(results.eigenvalues_alpha(0), results.eigenvalues_alpha(1));
}

TEST(SCFTest, RestrictedHeHCationMatchesVariationalMinimum)
{
    TestSystems::ScratchOutput output("rhf_heh");
    const IntegralSet heh = TestSystems::HeHCation();
    const double reference = variationalMinimum(heh);

    SCF scf(heh, tightOptions(), output.get());
    SCFResults results = scf.run();

    ASSERT_TRUE(results.converged);
    EXPECT_NEAR(results.totalEnergy, reference, 1e-7);
    EXPECT_NEAR(results.totalEnergy, -2.8607, 1e-3);
}

TEST(SCFTest, DIISAndPlainIterationAgree)
{
    const IntegralSet heh = TestSystems::HeHCation();

    TestSystems::ScratchOutput withOutput("heh_diis");
    SCFOptions withDIIS = tightOptions();
    SCFResults a        = SCF(heh, withDIIS, withOutput.get()).run();

    TestSystems::ScratchOutput withoutOutput("heh_plain");
    SCFOptions plain = tightOptions();
    plain.useDIIS    = false;
    plain.maxIter    = 500;
    SCFResults b     = SCF(heh, plain, withoutOutput.get()).run();

    ASSERT_TRUE(a.converged);
    ASSERT_TRUE(b.converged);
    EXPECT_NEAR(a.totalEnergy, b.totalEnergy, 1e-8);
    EXPECT_EQ(b.DIISFallbacks, 0u);
}

TEST(SCFTest, DelayedAndUnboundedDIISConverge)
{
    const IntegralSet heh = TestSystems::HeHCation();
    const double reference = variationalMinimum(heh);

    TestSystems::ScratchOutput delayedOutput("heh_delayed");
    SCFOptions delayed = tightOptions();
    delayed.DIISstart  = 4;
    SCFResults a       = SCF(heh, delayed, delayedOutput.get()).run();

    TestSystems::ScratchOutput unboundedOutput("heh_unbounded");
    SCFOptions unbounded  = tightOptions();
    unbounded.DIISmaxSize = 0;
    SCFResults b          = SCF(heh, unbounded, unboundedOutput.get()).run();

    ASSERT_TRUE(a.converged);
    ASSERT_TRUE(b.converged);
    EXPECT_NEAR(a.totalEnergy, reference, 1e-7);
    EXPECT_NEAR(b.totalEnergy, reference, 1e-7);
}

TEST(SCFTest, DampingConvergesToSameEnergy)
{
    const IntegralSet heh = TestSystems::HeHCation();

    TestSystems::ScratchOutput output("heh_damp");
    SCFOptions options   = tightOptions();
    options.useDIIS      = false;
    options.damp         = 30;
    options.maxDampIter  = 5;
    options.maxIter      = 500;
    SCFResults results   = SCF(heh, options, output.get()).run();

    ASSERT_TRUE(results.converged);
    EXPECT_NEAR(results.totalEnergy, variationalMinimum(heh), 1e-7);
}

TEST(SCFTest, UnrestrictedSingletEqualsRestricted)
{
    const IntegralSet h2 = TestSystems::H2();

    TestSystems::ScratchOutput output("uhf_h2");
    SCFOptions options   = tightOptions();
    options.unrestricted = true;
    SCFResults results   = SCF(h2, options, output.get()).run();

    ASSERT_TRUE(results.converged);
    EXPECT_TRUE(results.unrestricted);
    EXPECT_NEAR(results.totalEnergy, h2ClosedForm(h2), 1e-8);
    EXPECT_NEAR(results.spinSquared, 0.0, 1e-8);
    EXPECT_TRUE(results.D_alpha.isApprox(results.D_beta, 1e-8));
}

TEST(SCFTest, UnrestrictedDoubletH2Cation)
{
    const IntegralSet h2p = TestSystems::H2Cation();

    TestSystems::ScratchOutput output("uhf_h2p");
    SCFOptions options   = tightOptions();
    options.unrestricted = true;
    SCFResults results   = SCF(h2p, options, output.get()).run();

    // One electron: the energy is the core energy of the bonding orbital.
    Eigen::VectorXd g(2);
    g << 1.0, 1.0;
    g /= std::sqrt(2.0 * (1.0 + h2p.S(0, 1)));
    Eigen::MatrixXd h = h2p.T + h2p.V;

    ASSERT_TRUE(results.converged);
    EXPECT_EQ(results.occupiedCountAlpha, 1u);
    EXPECT_EQ(results.occupiedCountBeta, 0u);
    EXPECT_NEAR(results.totalEnergy, g.dot(h * g) + h2p.nuclearEnergy, 1e-8);
    EXPECT_NEAR(results.spinSquared, 0.75, 1e-10);
    EXPECT_NEAR(results.D_beta.norm(), 0.0, 1e-14);
}

TEST(SCFTest, RestrictedOpenShellThrows)
{
    TestSystems::ScratchOutput output("rhf_h2p");
    SCFOptions options   = tightOptions();
    options.unrestricted = false;
    const IntegralSet h2p = TestSystems::H2Cation();
    SCF scf(h2p, options, output.get());
    EXPECT_THROW(scf.run(), std::runtime_error);
}

TEST(SCFTest, NonConvergenceIsReportedNotThrown)
{
    TestSystems::ScratchOutput output("heh_maxiter");
    SCFOptions options = tightOptions();
    options.maxIter    = 1;
    const IntegralSet heh = TestSystems::HeHCation();
    SCFResults results;
    ASSERT_NO_THROW(results = SCF(heh, options, output.get()).run());
    EXPECT_FALSE(results.converged);
    EXPECT_EQ(results.iterations, 1u);
}

TEST(SCFTest, DensityFittedMatchesConventionalForFactorisedIntegrals)
{
    const IntegralSet system = TestSystems::factorisedSystem();

    TestSystems::ScratchOutput conventionalOutput("factorised_conventional");
    SCFResults conventional = SCF(system, tightOptions(), conventionalOutput.get()).run();

    TestSystems::ScratchOutput fittedOutput("factorised_df");
    SCFOptions options     = tightOptions();
    options.densityFitting = true;
    SCFResults fitted      = SCF(system, options, fittedOutput.get()).run();

    ASSERT_TRUE(conventional.converged);
    ASSERT_TRUE(fitted.converged);
    EXPECT_NEAR(conventional.totalEnergy, fitted.totalEnergy, 1e-9);
}

TEST(SCFTest, DensityFittingWithoutIntegralsThrows)
{
    TestSystems::ScratchOutput output("h2_no_df");
    SCFOptions options     = tightOptions();
    options.densityFitting = true;
    const IntegralSet h2 = TestSystems::H2();
    SCF scf(h2, options, output.get());
    EXPECT_THROW(scf.run(), std::runtime_error);
}

TEST(SCFTest, GuessMixingReturnsToStableSinglet)
{
    // H2 near equilibrium has no lower broken-symmetry UHF solution.
    const IntegralSet h2 = TestSystems::H2();

    TestSystems::ScratchOutput output("uhf_h2_mix");
    SCFOptions options   = tightOptions();
    options.unrestricted = true;
    options.guessMix     = 5;
    options.maxIter      = 200;
    options.maxDampIter  = options.maxIter;
    SCFResults results   = SCF(h2, options, output.get()).run();

    ASSERT_TRUE(results.converged);
    EXPECT_NEAR(results.totalEnergy, h2ClosedForm(h2), 1e-7);
    EXPECT_NEAR(results.spinSquared, 0.0, 1e-6);
}

TEST(UtilsTest, InverseSqrtOrthogonalizesOverlap)
{
    const IntegralSet heh = TestSystems::HeHCation();
    Eigen::MatrixXd X     = inverseSqrtMatrix(heh.S);
    EXPECT_TRUE((X.transpose() * heh.S * X).isApprox(Eigen::MatrixXd::Identity(2, 2), 1e-12));
}

TEST(UtilsTest, EnergyComparison)
{
    EnergyComparison pass = compareEnergy("SCF energy", -1.1167529, -1.1167530, 1e-6);
    EXPECT_TRUE(pass.passed);
    EXPECT_NEAR(pass.difference, 1e-7, 1e-12);
    EXPECT_NE(formatComparison(pass).find("PASSED"), std::string::npos);

    EnergyComparison fail = compareEnergy("MP2 energy", -1.12, -1.13, 1e-6);
    EXPECT_FALSE(fail.passed);
    EXPECT_NE(formatComparison(fail).find("FAILED"), std::string::npos);
}

TEST(OutputTest, TruncatesAndAppends)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "pulayscf_output_test.out";
    {
        std::ofstream stale(path);
        stale << "left over from an earlier run\n";
    }

    {
        Output output(path.string());
        output.write("first\n");
        output.writeSeperator('=', 5);

        // Each write is visible before the object goes away.
        std::ifstream partial(path);
        std::string contents((std::istreambuf_iterator<char>(partial)), std::istreambuf_iterator<char>());
        EXPECT_EQ(contents, "first\n=====\n");

        output.writeBanner("MP2", 7);
    }

    std::ifstream file(path);
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "first\n=====\n\n-------\n  MP2  \n-------\n");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(OutputTest, UnwritablePathThrows)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "pulayscf_missing_dir" / "run.out";
    EXPECT_THROW(Output(path.string()), std::runtime_error);
}
