#include "SCF.hpp"

#include "FockBuild.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fmt/core.h>
#include <sstream>
#include <stdexcept>

namespace
{
// UHF trial and residual vectors hold the alpha block on top of the beta block.
Eigen::MatrixXd stackSpins(const Eigen::MatrixXd& alpha, const Eigen::MatrixXd& beta)
{
    Eigen::MatrixXd stacked(alpha.rows() + beta.rows(), alpha.cols());
    stacked << alpha, beta;
    return stacked;
}
} // namespace

SCF::SCF(const IntegralSet& integrals, const SCFOptions& options, std::shared_ptr<Output> output) :
    output(output),
    integrals(integrals),
    options(options)
{
}


SCFResults SCF::run()
{
    // One-time setup of the core Hamiltonian and the orthogonalizer.
    this->initialize();

    // Core-Hamiltonian guess.
    this->computeInitialGuessDensity();

    if (this->options.useDIIS) // Initialize the DIIS handler with the specified maximum size.
        diis_handler = std::make_unique<DIIS<Eigen::MatrixXd>>(this->options.DIISmaxSize);

    // Print header for the iteration table.
    size_t width = 75;
    if (this->options.useDIIS)
        width += 30;
    std::stringstream ss;
    ss << fmt::format("\n{:-<{}}\n", "", width);
    ss << fmt::format("{:^15}{:^30}{:^15}{:^15}", "Iteration", "Total Energy", "ΔE", "ΔD");
    if (this->options.useDIIS)
        ss << fmt::format("{:^15}{:^15}", "DIIS RMS", "DIIS Vectors");
    ss << fmt::format("\n{:-<{}}\n", "", width);
    this->output->write(ss.str());

    // SCF cycles
    for (this->iteration = 0; this->iteration < this->options.maxIter; ++this->iteration)
    {
        // Store the energy from the previous iteration to check for convergence.
        double lastElectronicEnergy = this->electronicEnergy;

        // Build the new Fock matrix (and the energy) from the current density.
        this->buildFockMatrix();
        this->deltaE = std::abs(this->electronicEnergy - lastElectronicEnergy);

        // Extrapolate the Fock matrices if DIIS is on, then diagonalize.
        const auto [F_alpha_diag, F_beta_diag] = this->accelerate();
        this->diagonalizeAndUpdate(F_alpha_diag, F_beta_diag);

        this->deltaD = (this->D_tot - this->D_tot_prev).norm();

        // Print the current iteration results.
        this->printIteration();

        // Check for convergence.
        if (this->deltaE < this->options.energyTol && this->deltaD < this->options.densityTol
            && (!this->options.useDIIS || this->DIISError < this->options.DIISErrorTol))
        {
            this->output->writeSeperator('-', width);
            this->printFinalResults(true);
            return this->collectResults(true);
        }
    }

    // Out of iterations.
    this->output->writeSeperator('-', width);
    this->printFinalResults(false);
    return this->collectResults(false);
}

void SCF::initialize()
{
    // Set constant parameters.
    this->basisCount         = this->integrals.basisCount;
    this->occupiedCountAlpha = this->integrals.occupiedCountAlpha();
    this->occupiedCountBeta  = this->integrals.occupiedCountBeta();
    this->nuclearEnergy      = this->integrals.nuclearEnergy;

    if (!this->options.unrestricted && this->occupiedCountAlpha != this->occupiedCountBeta)
        throw std::runtime_error("Restricted (RHF) calculations require a closed-shell system (multiplicity 1).");

    this->h = this->integrals.T + this->integrals.V;
    this->S = this->integrals.S;
    this->X = inverseSqrtMatrix(this->S);

    if (this->options.densityFitting)
    {
        if (!this->integrals.densityFitting)
            throw std::runtime_error("Density fitting requested but the integral file has no density-fitting integrals.");
        this->densityFitting = buildDensityFittingTensor(*this->integrals.densityFitting, this->basisCount);
    }

    this->output->write(printJobSpec());
}


void SCF::computeInitialGuessDensity()
{
    // The initial Fock matrix is just the core Hamiltonian.
    this->F_alpha = this->h;

    // Diagonalize the initial Fock matrix to get guess orbitals.
    Eigen::MatrixXd F_alpha_prime = this->X.transpose() * this->F_alpha * this->X;
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> alpha_solver(F_alpha_prime);
    this->C_alpha           = this->X * alpha_solver.eigenvectors();
    this->eigenvalues_alpha = alpha_solver.eigenvalues();

    // HOMO-LUMO mixing for breaking spin symmetry in UHF.
    if (this->options.unrestricted && this->options.guessMix > 0 && this->occupiedCountAlpha > 0
        && this->occupiedCountAlpha < this->basisCount)
    {
        double k = static_cast<double>(this->options.guessMix) / 10.0;

        Eigen::VectorXd homoAlpha = this->C_alpha.col(this->occupiedCountAlpha - 1);
        Eigen::VectorXd lumoAlpha = this->C_alpha.col(this->occupiedCountAlpha);

        this->C_alpha.col(this->occupiedCountAlpha - 1) = (1 / std::sqrt(1 + k * k)) * (homoAlpha + k * lumoAlpha);
        this->C_alpha.col(this->occupiedCountAlpha)     = (1 / std::sqrt(1 + k * k)) * (lumoAlpha - k * homoAlpha);
    }

    // Form the density matrices from the occupied orbitals.
    Eigen::MatrixXd C_alpha_occ = this->C_alpha.leftCols(this->occupiedCountAlpha);
    this->D_alpha               = C_alpha_occ * C_alpha_occ.transpose();

    // Both spins start from the same core orbitals.
    this->F_beta           = this->h;
    this->C_beta           = this->X * alpha_solver.eigenvectors();
    this->eigenvalues_beta = this->eigenvalues_alpha;
    if (this->options.unrestricted)
    {
        Eigen::MatrixXd C_beta_occ = this->C_beta.leftCols(this->occupiedCountBeta);
        this->D_beta               = C_beta_occ * C_beta_occ.transpose();
    }
    else
    {
        this->D_beta = this->D_alpha;
    }

    this->D_tot_prev = Eigen::MatrixXd::Zero(this->basisCount, this->basisCount);
    this->D_tot      = this->D_alpha + this->D_beta;

    // Energy of the guess density with the core Hamiltonian as Fock matrix.
    this->electronicEnergy = 0.5 * (this->D_alpha * (this->h + this->F_alpha)).trace()
                           + 0.5 * (this->D_beta * (this->h + this->F_beta)).trace();
}

void SCF::buildFockMatrix()
{
    JKMatrices jk = this->densityFitting
                      ? buildJK(*this->densityFitting, this->D_alpha, this->D_beta, this->options.unrestricted)
                      : buildJK(this->integrals.eri, this->D_alpha, this->D_beta, this->options.unrestricted);

    this->F_alpha = this->h + jk.J - jk.K_alpha;
    if (this->options.unrestricted)
        this->F_beta = this->h + jk.J - jk.K_beta;
    else
        this->F_beta = this->F_alpha;

    // E = 1/2 sum_sigma tr[D_sigma (h + F_sigma)]
    this->electronicEnergy = 0.5 * (this->D_alpha * (this->h + this->F_alpha)).trace()
                           + 0.5 * (this->D_beta * (this->h + this->F_beta)).trace();
}

Eigen::MatrixXd SCF::computeResidual(const Eigen::MatrixXd& F, const Eigen::MatrixXd& D) const
{
    // Commutator of the Fock and density matrices, in the orthogonal basis.
    Eigen::MatrixXd FDS = F * D * this->S;
    return this->X.transpose() * (FDS - FDS.transpose()) * this->X;
}

std::pair<Eigen::MatrixXd, Eigen::MatrixXd> SCF::accelerate()
{
    this->DIISFellBack = false;
    if (!this->options.useDIIS)
        return {this->F_alpha, this->F_beta};

    Eigen::MatrixXd trial, residual;
    if (this->options.unrestricted)
    {
        trial    = stackSpins(this->F_alpha, this->F_beta);
        residual = stackSpins(
            this->computeResidual(this->F_alpha, this->D_alpha), this->computeResidual(this->F_beta, this->D_beta)
        );
    }
    else
    {
        trial    = this->F_alpha;
        residual = this->computeResidual(this->F_alpha, this->D_alpha);
    }

    // Store only until the extrapolation starts.
    if (this->iteration + 1 < this->options.DIISstart)
    {
        diis_handler->update(trial, residual);
        this->DIISError = diis_handler->getErrorRMS();
        return {this->F_alpha, this->F_beta};
    }

    const size_t fallbacksBefore = diis_handler->getFallbackCount();
    Eigen::MatrixXd extrapolated = diis_handler->step(trial, residual);
    this->DIISFellBack           = diis_handler->getFallbackCount() > fallbacksBefore;
    this->DIISError              = diis_handler->getErrorRMS();

    if (this->options.unrestricted)
        return {extrapolated.topRows(this->basisCount), extrapolated.bottomRows(this->basisCount)};
    return {extrapolated, extrapolated};
}

void SCF::diagonalizeAndUpdate(const Eigen::MatrixXd& F_alpha_diag, const Eigen::MatrixXd& F_beta_diag)
{
    // Check whether to use damping.
    if (this->options.damp > 0 && this->options.maxDampIter > this->iteration
        && (this->deltaE > this->options.stopDampThresh || this->iteration == 0))
    {
        this->dampCoeff = static_cast<double>(this->options.damp) / 100;
    }
    else
    {
        this->dampCoeff = 0;
    }

    // Transform the Fock matrix to the orthogonal basis and diagonalize it.
    Eigen::MatrixXd F_alpha_prime = this->X.transpose() * F_alpha_diag * this->X;
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> alpha_solver(F_alpha_prime);
    this->C_alpha           = this->X * alpha_solver.eigenvectors();
    this->eigenvalues_alpha = alpha_solver.eigenvalues();

    // New density, mixed with the previous one when damping is active.
    Eigen::MatrixXd C_alpha_occ = this->C_alpha.leftCols(this->occupiedCountAlpha);
    this->D_alpha = (1 - this->dampCoeff) * C_alpha_occ * C_alpha_occ.transpose() + this->dampCoeff * this->D_alpha;

    // Beta orbitals are independent only for UHF.
    if (this->options.unrestricted)
    {
        Eigen::MatrixXd F_beta_prime = this->X.transpose() * F_beta_diag * this->X;
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> beta_solver(F_beta_prime);
        this->C_beta               = this->X * beta_solver.eigenvectors();
        this->eigenvalues_beta     = beta_solver.eigenvalues();
        Eigen::MatrixXd C_beta_occ = this->C_beta.leftCols(this->occupiedCountBeta);
        this->D_beta = (1 - this->dampCoeff) * C_beta_occ * C_beta_occ.transpose() + this->dampCoeff * this->D_beta;
    }
    else
    {
        this->C_beta           = this->C_alpha;
        this->eigenvalues_beta = this->eigenvalues_alpha;
        this->D_beta           = this->D_alpha;
    }

    this->D_tot_prev = this->D_tot;
    this->D_tot      = this->D_alpha + this->D_beta;
}

double SCF::computeSpinSquared() const
{
    // <S^2> = S_z(S_z + 1) + N_beta - sum_ij |<psi_i_alpha | psi_j_beta>|^2
    double Sz               = 0.5 * (static_cast<double>(this->occupiedCountAlpha) - this->occupiedCountBeta);
    double alphaBetaOverlap = (this->C_alpha.leftCols(this->occupiedCountAlpha).transpose() * this->S
                               * this->C_beta.leftCols(this->occupiedCountBeta))
                                  .squaredNorm();
    return (Sz * (Sz + 1)) + this->occupiedCountBeta - alphaBetaOverlap;
}

SCFResults SCF::collectResults(bool converged) const
{
    SCFResults results;
    results.converged          = converged;
    results.unrestricted       = this->options.unrestricted;
    results.iterations         = std::min(this->iteration + 1, this->options.maxIter);
    results.occupiedCountAlpha = this->occupiedCountAlpha;
    results.occupiedCountBeta  = this->occupiedCountBeta;
    results.DIISFallbacks      = this->diis_handler ? this->diis_handler->getFallbackCount() : 0;
    results.electronicEnergy   = this->electronicEnergy;
    results.nuclearEnergy      = this->nuclearEnergy;
    results.totalEnergy        = this->electronicEnergy + this->nuclearEnergy;
    results.spinSquared        = this->options.unrestricted ? this->computeSpinSquared() : 0.0;
    results.C_alpha            = this->C_alpha;
    results.C_beta             = this->C_beta;
    results.D_alpha            = this->D_alpha;
    results.D_beta             = this->D_beta;
    results.F_alpha            = this->F_alpha;
    results.F_beta             = this->F_beta;
    results.eigenvalues_alpha  = this->eigenvalues_alpha;
    results.eigenvalues_beta   = this->eigenvalues_beta;
    return results;
}

void SCF::printIteration() const
{
    std::stringstream ss;
    ss << fmt::format(
        "{:^15}{:^30.12f}{:^15.5e}{:^15.5e}",
        this->iteration + 1,
        this->electronicEnergy + this->nuclearEnergy,
        this->deltaE,
        this->deltaD
    );
    if (this->options.useDIIS)
        ss << fmt::format("{:^15.5e}{:^15}", this->DIISError, this->diis_handler->getHistory().size());
    if (this->DIISFellBack)
        ss << fmt::format("{:^15}", "DIIS skipped");
    if (this->dampCoeff > 0)
        ss << fmt::format("{:^15}", fmt::format("damp: {:.2f}", this->dampCoeff));
    ss << "\n";

    this->output->write(ss.str());
}


void SCF::printFinalResults(bool converged) const
{
    std::stringstream ss;
    ss << std::left;
    if (converged)
        ss << "\nSCF converged!\n";
    else
        ss << "\nWarning: Maximum iterations reached. SCF did not converge!\n";

    double totalEnergy = this->electronicEnergy + this->nuclearEnergy;
    ss << fmt::format(
        "\n--- SCF Results ---\n"
        "{0}"
        "Electronic Energy: {1:>18.12f}\n"
        "Nuclear Repulsion: {2:>18.12f}\n"
        "Total SCF Energy:  {3:>18.12f}\n",
        this->options.unrestricted ? fmt::format("<S^2>: {:>18.12f}\n", computeSpinSquared()) : "",
        this->electronicEnergy,
        this->nuclearEnergy,
        totalEnergy
    );
    if (this->diis_handler && this->diis_handler->getFallbackCount() > 0)
    {
        ss << fmt::format(
            "DIIS extrapolation skipped {} time(s) (singular Pulay system).\n", this->diis_handler->getFallbackCount()
        );
    }

    ss << fmt::format("\n{:-<{}}\n", "", 99);
    std::string title = this->options.unrestricted ? "Alpha Orbital Energies (a.u.)" : "Orbital Energies (a.u.)";
    ss << fmt::format("{:^99}\n", title);
    ss << fmt::format("{:-<{}}\n", "", 99);

    ss << "-- Occupied --\n";
    ss << printShortMOs(this->eigenvalues_alpha.head(this->occupiedCountAlpha), 5, 7);
    ss << "-- Virtual --\n";
    ss << printShortMOs(this->eigenvalues_alpha.tail(this->basisCount - this->occupiedCountAlpha), 5, 7);
    ss << fmt::format("{:-<{}}\n", "", 99);

    if (this->options.unrestricted)
    {
        ss << fmt::format("\n{:-<{}}\n", "", 99);
        ss << fmt::format("{:^99}\n", "Beta Orbital Energies (a.u.)");
        ss << fmt::format("{:-<{}}\n", "", 99);

        ss << "-- Occupied --\n";
        ss << printShortMOs(this->eigenvalues_beta.head(this->occupiedCountBeta), 5, 7);
        ss << "-- Virtual --\n";
        ss << printShortMOs(this->eigenvalues_beta.tail(this->basisCount - this->occupiedCountBeta), 5, 7);
        ss << fmt::format("{:-<{}}\n", "", 99);
    }

    this->output->write(ss.str());
}

std::string SCF::printShortMOs(const Eigen::VectorXd& eigenvalues, size_t precision, size_t MOsPerRow) const
{
    const int width = 6 + precision;

    auto format = [&precision, &width](double num) -> std::string
    { return fmt::format("{}{:<{}.{}e} ", std::signbit(num) ? "-" : " ", std::abs(num), width - 1, precision); };

    std::stringstream ss;
    ss << std::left;

    size_t rowsLimit = std::ceil(static_cast<double>(eigenvalues.size()) / static_cast<double>(MOsPerRow));
    for (size_t k = 0; k < rowsLimit; ++k)
    {
        size_t startIndex = k * MOsPerRow;
        size_t numMOs     = eigenvalues.size();
        size_t endIndex   = std::min(startIndex + MOsPerRow, numMOs);

        for (size_t i = startIndex; i < endIndex; ++i) { ss << format(eigenvalues(i)); }
        ss << "\n";
    }

    return ss.str();
}

std::string SCF::printJobSpec() const
{
    std::stringstream ss;

    ss << fmt::format(
        "Starting {} calculation.\n\n"
        "Maximum Iterations: {}.\n"
        "Energy Convergence Threshold: {:.6e}.\n"
        "Density Convergence Threshold: {:.6e}.\n\n",
        this->options.unrestricted ? "UHF" : "RHF",
        this->options.maxIter,
        this->options.energyTol,
        this->options.densityTol
    );

    if (this->options.useDIIS)
    {
        ss << fmt::format(
            "DIIS enabled.\nSize of DIIS history: {}.\nDIIS extrapolation starts at iteration {}.\n"
            "DIIS RMS error threshold: {:.6e}.\n\n",
            this->options.DIISmaxSize == 0 ? std::string("unbounded") : std::to_string(this->options.DIISmaxSize),
            this->options.DIISstart,
            this->options.DIISErrorTol
        );
    }
    if (this->options.guessMix > 0)
    {
        ss << fmt::format("Requested {}% mixing of HOMO and LUMO orbitals in initial guess.\n\n", this->options.guessMix * 10);
    }
    if (this->options.damp > 0)
    {
        ss << fmt::format("Damping enabled. Mixing coefficient set to: {:.2f}.\n", static_cast<double>(this->options.damp) / 100);
        if (this->options.maxDampIter < this->options.maxIter)
            ss << fmt::format("Damping will stop after iteration {}.\n", this->options.maxDampIter);
        if (this->options.stopDampThresh != 0)
            ss << fmt::format("Damping will stop once ΔE < {:.6e}.\n", this->options.stopDampThresh);
        ss << "\n";
    }
    if (this->densityFitting)
    {
        ss << fmt::format("Density-fitted J and K with {} auxiliary functions.\n\n", this->densityFitting->auxCount);
    }

    ss << fmt::format(
        "System with {} alpha and {} beta electrons.\n"
        "Number of basis functions: {}.\n"
        "Nuclear repulsion energy: {:.12f}.\n",
        this->occupiedCountAlpha,
        this->occupiedCountBeta,
        this->basisCount,
        this->nuclearEnergy
    );

    return ss.str();
}
