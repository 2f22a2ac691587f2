#pragma once
#include "DensityFitting.hpp"
#include "Integrals.hpp"
#include "Output.hpp"
#include "SCF.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>

struct MP2Options
{
    bool densityFitting = false;
    double osScale      = 1.2;       // SCS opposite-spin scale
    double ssScale      = 1.0 / 3.0; // SCS same-spin scale
};

/**
 * @brief Second-order Moller-Plesset correlation energy and its spin components.
 */
struct MP2Results
{
    double sameSpinEnergy       = 0.0;
    double oppositeSpinEnergy   = 0.0;
    double correlationEnergy    = 0.0;
    double totalEnergy          = 0.0; // SCF + correlation
    double SCSCorrelationEnergy = 0.0;
    double SCSTotalEnergy       = 0.0;
};

struct MP2Components
{
    double sameSpin     = 0.0;
    double oppositeSpin = 0.0;
};

/**
 * Closed-shell MP2 from (ia|jb) integrals in spatial orbitals.
 *
 * @param ovov (nocc * nvir) x (nocc * nvir) matrix, element (i * nvir + a, j * nvir + b) is (ia|jb).
 * @param epsOcc Occupied orbital energies.
 * @param epsVir Virtual orbital energies.
 * @return Same-spin (both spins together) and opposite-spin components.
 */
MP2Components restrictedMP2(const Eigen::MatrixXd& ovov, const Eigen::VectorXd& epsOcc, const Eigen::VectorXd& epsVir);

/**
 * Same-spin MP2 energy of one spin, 1/2 sum (ia|jb) [(ia|jb) - (ib|ja)] / (e_i + e_j - e_a - e_b).
 */
double sameSpinMP2(const Eigen::MatrixXd& ovov, const Eigen::VectorXd& epsOcc, const Eigen::VectorXd& epsVir);

/**
 * Opposite-spin MP2 energy, sum (ia|JB)^2 / (e_i + e_J - e_a - e_B).
 *
 * @param ovOV (noccA * nvirA) x (noccB * nvirB) matrix of mixed-spin integrals.
 */
double oppositeSpinMP2(
    const Eigen::MatrixXd& ovOV,
    const Eigen::VectorXd& epsOccAlpha,
    const Eigen::VectorXd& epsVirAlpha,
    const Eigen::VectorXd& epsOccBeta,
    const Eigen::VectorXd& epsVirBeta
);

/**
 * @brief MP2 on top of a converged RHF or UHF reference.
 */
class MP2
{
  public:
    MP2(const SCFResults& scfResults, const IntegralSet& integrals, const MP2Options& options, std::shared_ptr<Output> output);

    /**
     * @throws std::runtime_error if the reference did not converge or there are no virtual orbitals.
     */
    MP2Results run();

  private:
    const std::shared_ptr<Output> output;
    const SCFResults& scfResults;
    const IntegralSet& integrals;
    const MP2Options options;
    std::optional<DensityFittingTensor> densityFitting;

    /**
     * Returns the (ov|ov) integrals for the given occupied and virtual coefficient blocks of the two electrons.
     */
    Eigen::MatrixXd ovovIntegrals(
        const Eigen::MatrixXd& C_occ1, const Eigen::MatrixXd& C_vir1, const Eigen::MatrixXd& C_occ2, const Eigen::MatrixXd& C_vir2
    ) const;

    void printResults(const MP2Results& results) const;
};
