#include "MP2.hpp"
#include "SCF.hpp"
#include "TestSystems.hpp"

#include <Eigen/Dense>
#include <gtest/gtest.h>
#include <stdexcept>

namespace
{
SCFOptions tightOptions(bool unrestricted = false)
{
    SCFOptions options;
    options.maxIter      = 100;
    options.energyTol    = 1e-12;
    options.densityTol   = 1e-10;
    options.DIISErrorTol = 1e-10;
    options.maxDampIter  = options.maxIter;
    options.unrestricted = unrestricted;
    return options;
}
} // namespace

TEST(MP2Test, ClosedShellTwoOrbitalFormula)
{
    Eigen::MatrixXd ovov(1, 1);
    ovov(0, 0) = 0.2;
    Eigen::VectorXd epsOcc(1), epsVir(1);
    epsOcc << -0.5;
    epsVir << 0.5;

    MP2Components components = restrictedMP2(ovov, epsOcc, epsVir);
    EXPECT_NEAR(components.oppositeSpin, 0.04 / -2.0, 1e-15);
    EXPECT_NEAR(components.sameSpin, 0.0, 1e-15);
    EXPECT_NEAR(sameSpinMP2(ovov, epsOcc, epsVir), 0.0, 1e-15);
    EXPECT_NEAR(oppositeSpinMP2(ovov, epsOcc, epsVir, epsOcc, epsVir), 0.04 / -2.0, 1e-15);
}

TEST(MP2Test, SameSpinRestrictedIsTwiceOneSpin)
{
    // Two occupied and two virtual orbitals with (ia|jb) != (ib|ja).
    Eigen::MatrixXd ovov(4, 4);
    ovov << 0.30, 0.05, 0.10, 0.02,
            0.05, 0.25, 0.04, 0.08,
            0.10, 0.04, 0.28, 0.06,
            0.02, 0.08, 0.06, 0.22;
    Eigen::VectorXd epsOcc(2), epsVir(2);
    epsOcc << -1.0, -0.6;
    epsVir << 0.3, 0.8;

    MP2Components components = restrictedMP2(ovov, epsOcc, epsVir);
    EXPECT_NEAR(components.sameSpin, 2.0 * sameSpinMP2(ovov, epsOcc, epsVir), 1e-14);
    EXPECT_NEAR(components.oppositeSpin, oppositeSpinMP2(ovov, epsOcc, epsVir, epsOcc, epsVir), 1e-14);
    EXPECT_LT(components.sameSpin, 0.0);
    EXPECT_LT(components.oppositeSpin, 0.0);
}

TEST(MP2Test, RestrictedH2MatchesClosedForm)
{
    const IntegralSet h2 = TestSystems::H2();
    TestSystems::ScratchOutput output("mp2_h2");

    SCFResults scfResults = SCF(h2, tightOptions(), output.get()).run();
    ASSERT_TRUE(scfResults.converged);

    MP2 mp2(scfResults, h2, MP2Options(), output.get());
    MP2Results results = mp2.run();

    // E = (gu|gu)^2 / (2 (e_g - e_u))
    Eigen::VectorXd g = scfResults.C_alpha.col(0);
    Eigen::VectorXd u = scfResults.C_alpha.col(1);
    double K          = TestSystems::moIntegral(h2.eri, g, u, g, u);
    double expected   = K * K / (2.0 * (scfResults.eigenvalues_alpha(0) - scfResults.eigenvalues_alpha(1)));

    EXPECT_NEAR(results.correlationEnergy, expected, 1e-10);
    EXPECT_NEAR(results.correlationEnergy, -0.01315, 1e-4);
    EXPECT_NEAR(results.sameSpinEnergy, 0.0, 1e-12);
    EXPECT_NEAR(results.totalEnergy, scfResults.totalEnergy + results.correlationEnergy, 1e-14);
}

TEST(MP2Test, SpinComponentScaling)
{
    const IntegralSet heh = TestSystems::HeHCation();
    TestSystems::ScratchOutput output("mp2_scs");

    SCFResults scfResults = SCF(heh, tightOptions(), output.get()).run();
    ASSERT_TRUE(scfResults.converged);

    MP2Options options;
    options.osScale    = 1.2;
    options.ssScale    = 1.0 / 3.0;
    MP2Results results = MP2(scfResults, heh, options, output.get()).run();

    EXPECT_NEAR(
        results.SCSCorrelationEnergy, 1.2 * results.oppositeSpinEnergy + results.sameSpinEnergy / 3.0, 1e-14
    );
    EXPECT_NEAR(results.SCSTotalEnergy, scfResults.totalEnergy + results.SCSCorrelationEnergy, 1e-14);
    EXPECT_NEAR(results.correlationEnergy, results.sameSpinEnergy + results.oppositeSpinEnergy, 1e-14);
}

TEST(MP2Test, UnrestrictedSingletEqualsRestricted)
{
    const IntegralSet h2 = TestSystems::H2();

    TestSystems::ScratchOutput restrictedOutput("rmp2_h2");
    SCFResults rhf = SCF(h2, tightOptions(false), restrictedOutput.get()).run();
    MP2Results rmp2 = MP2(rhf, h2, MP2Options(), restrictedOutput.get()).run();

    TestSystems::ScratchOutput unrestrictedOutput("ump2_h2");
    SCFResults uhf = SCF(h2, tightOptions(true), unrestrictedOutput.get()).run();
    MP2Results ump2 = MP2(uhf, h2, MP2Options(), unrestrictedOutput.get()).run();

    ASSERT_TRUE(rhf.converged);
    ASSERT_TRUE(uhf.converged);
    EXPECT_NEAR(ump2.correlationEnergy, rmp2.correlationEnergy, 1e-9);
    EXPECT_NEAR(ump2.oppositeSpinEnergy, rmp2.oppositeSpinEnergy, 1e-9);
    EXPECT_NEAR(ump2.sameSpinEnergy, rmp2.sameSpinEnergy, 1e-9);
}

TEST(MP2Test, OneElectronHasNoCorrelation)
{
    const IntegralSet h2p = TestSystems::H2Cation();
    TestSystems::ScratchOutput output("ump2_h2p");

    SCFResults uhf = SCF(h2p, tightOptions(true), output.get()).run();
    ASSERT_TRUE(uhf.converged);

    MP2Results results = MP2(uhf, h2p, MP2Options(), output.get()).run();
    EXPECT_DOUBLE_EQ(results.correlationEnergy, 0.0);
    EXPECT_DOUBLE_EQ(results.totalEnergy, uhf.totalEnergy);
}

TEST(MP2Test, DensityFittedMatchesConventionalForFactorisedIntegrals)
{
    const IntegralSet system = TestSystems::factorisedSystem();
    TestSystems::ScratchOutput output("mp2_factorised");

    SCFResults scfResults = SCF(system, tightOptions(), output.get()).run();
    ASSERT_TRUE(scfResults.converged);

    MP2Results conventional = MP2(scfResults, system, MP2Options(), output.get()).run();

    MP2Options fittedOptions;
    fittedOptions.densityFitting = true;
    MP2Results fitted            = MP2(scfResults, system, fittedOptions, output.get()).run();

    EXPECT_LT(conventional.correlationEnergy, 0.0);
    EXPECT_NEAR(fitted.correlationEnergy, conventional.correlationEnergy, 1e-12);
    EXPECT_NEAR(fitted.sameSpinEnergy, conventional.sameSpinEnergy, 1e-12);
}

TEST(MP2Test, RequiresConvergedReferenceWithVirtuals)
{
    const IntegralSet h2 = TestSystems::H2();
    TestSystems::ScratchOutput output("mp2_invalid");

    SCFResults unconverged;
    unconverged.converged = false;
    EXPECT_THROW(MP2(unconverged, h2, MP2Options(), output.get()).run(), std::runtime_error);

    SCFResults noVirtuals;
    noVirtuals.converged          = true;
    noVirtuals.occupiedCountAlpha = 2;
    noVirtuals.occupiedCountBeta  = 2;
    EXPECT_THROW(MP2(noVirtuals, h2, MP2Options(), output.get()).run(), std::runtime_error);

    SCFResults converged = SCF(h2, tightOptions(), output.get()).run();
    MP2Options fittedOptions;
    fittedOptions.densityFitting = true;
    EXPECT_THROW(MP2(converged, h2, fittedOptions, output.get()).run(), std::runtime_error);
}
