#pragma once
#include "DIIS.hpp"
#include "DensityFitting.hpp"
#include "Integrals.hpp"
#include "Output.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>

struct SCFOptions
{
    size_t maxIter         = 50;
    double energyTol       = 1.0e-6;
    double densityTol      = 1.0e-6;
    bool useDIIS           = true;
    size_t DIISmaxSize     = 8; // 0 = unbounded
    size_t DIISstart       = 1; // first iteration (1-based) that extrapolates
    double DIISErrorTol    = 1.0e-6;
    bool unrestricted      = false;
    int guessMix           = 0;
    int damp               = 0;
    size_t maxDampIter     = 0;
    double stopDampThresh  = 0;
    bool densityFitting    = false;
};

/**
 * @brief Converged (or last) state of an SCF calculation.
 */
struct SCFResults
{
    bool converged            = false;
    bool unrestricted         = false;
    size_t iterations         = 0;
    size_t occupiedCountAlpha = 0;
    size_t occupiedCountBeta  = 0;
    size_t DIISFallbacks      = 0;
    double electronicEnergy   = 0.0;
    double nuclearEnergy      = 0.0;
    double totalEnergy        = 0.0;
    double spinSquared        = 0.0;
    Eigen::MatrixXd C_alpha;
    Eigen::MatrixXd C_beta;
    Eigen::MatrixXd D_alpha;
    Eigen::MatrixXd D_beta;
    Eigen::MatrixXd F_alpha;
    Eigen::MatrixXd F_beta;
    Eigen::VectorXd eigenvalues_alpha;
    Eigen::VectorXd eigenvalues_beta;
};

/**
 * @brief Class for performing Self-Consistent Field (SCF) calculations from precomputed integrals.
 *
 * Runs restricted (RHF) or unrestricted (UHF) Hartree-Fock. The Fock matrix (alpha and beta stacked for UHF) is the
 * DIIS trial vector and the orthogonalised commutator X^T (FDS - SDF) X is its residual.
 */
class SCF
{
  public:
    SCF(const IntegralSet& integrals, const SCFOptions& options, std::shared_ptr<Output> output);

    /**
     * Runs the Self-Consistent Field (SCF) calculation.
     *
     * @return The final state. SCFResults::converged is false if the maximum number of iterations was reached.
     */
    SCFResults run();

  private:
    const std::shared_ptr<Output> output; // output handler

    const IntegralSet& integrals; // Integrals from the external package
    const SCFOptions options;     // SCF options and parameters.

    // SCF state variables that are constant throughout the calculation.
    size_t basisCount;         // number of basis functions
    size_t occupiedCountAlpha; // number of occupied alpha orbitals
    size_t occupiedCountBeta;  // number of occupied beta orbitals
    double nuclearEnergy;      // Nuclear repulsion energy
    Eigen::MatrixXd h;         // Core Hamiltonian (T+V)
    Eigen::MatrixXd S;         // Overlap matrix
    Eigen::MatrixXd X;         // Orthogonalization matrix S^(-1/2)
    std::optional<DensityFittingTensor> densityFitting;

    // SCF state variables that change during iterations.
    size_t iteration        = 0;     // Current iteration number
    double deltaE           = 0.0;   // Change in electronic energy from last iteration
    double deltaD           = 0.0;   // Change in total density matrix from last iteration
    double DIISError        = 0.0;   // RMS of the latest DIIS residual
    bool DIISFellBack       = false; // The Pulay system was singular this iteration
    double dampCoeff        = 0.0;   // Density damping applied this iteration
    double electronicEnergy = 0.0;   // Electronic energy
    Eigen::MatrixXd D_alpha;           // Density matrix
    Eigen::MatrixXd F_alpha;           // Fock matrix
    Eigen::MatrixXd C_alpha;           // MO coefficient matrix
    Eigen::VectorXd eigenvalues_alpha; // Eigenvalues of the Fock matrix
    Eigen::MatrixXd D_beta;
    Eigen::MatrixXd F_beta;
    Eigen::MatrixXd C_beta;
    Eigen::VectorXd eigenvalues_beta;
    Eigen::MatrixXd D_tot;      // D_alpha + D_beta
    Eigen::MatrixXd D_tot_prev; // D_tot of the previous iteration

    // DIIS extrapolator (if used).
    std::unique_ptr<DIIS<Eigen::MatrixXd>> diis_handler;

    /**
     * One-time setup: core Hamiltonian, orthogonalization matrix and, if requested, the density-fitting tensor.
     */
    void initialize();

    /**
     * Computes the initial guess for the density matrix from the core Hamiltonian (T + V).
     */
    void computeInitialGuessDensity();

    /**
     * Builds the Fock matrices from the current density matrices and computes the electronic energy.
     */
    void buildFockMatrix();

    /**
     * Computes the orthogonalised commutator X^T (F D S - S D F) X for one spin.
     */
    Eigen::MatrixXd computeResidual(const Eigen::MatrixXd& F, const Eigen::MatrixXd& D) const;

    /**
     * Feeds the current Fock matrices to DIIS and returns the matrices to diagonalize.
     */
    std::pair<Eigen::MatrixXd, Eigen::MatrixXd> accelerate();

    /**
     * Diagonalizes the given Fock matrices and updates the orbitals and density matrices (with damping, if active).
     */
    void diagonalizeAndUpdate(const Eigen::MatrixXd& F_alpha_diag, const Eigen::MatrixXd& F_beta_diag);

    /**
     * Computes the expectation value of the total spin squared operator <S^2>.
     *
     * @return The computed value of <S^2>.
     */
    double computeSpinSquared() const;

    /**
     * Write the status of a single SCF iteration to the output.
     */
    void printIteration() const;

    /**
     * Prints the final results of the SCF calculation, including whether it converged and the final energy.
     *
     * @param converged True if the SCF calculation converged, false otherwise.
     */
    void printFinalResults(bool converged) const;

    /**
     * Formats and returns a short string representation of the molecular orbital eigenvalues.
     *
     * @param eigenvalues The vector of molecular orbital eigenvalues.
     * @param precision The number of decimal places to display for the eigenvalues.
     * @param MOsPerRow The number of molecular orbitals to display per row.
     * @return A formatted string representing the molecular orbital eigenvalues.
     */
    std::string printShortMOs(const Eigen::VectorXd& eigenvalues, size_t precision, size_t MOsPerRow) const;

    /**
     * Returns a string summarizing the SCF job specifications.
     */
    std::string printJobSpec() const;

    SCFResults collectResults(bool converged) const;
};
