#include "MP2.hpp"

#include "MOTransform.hpp"

#include <fmt/core.h>
#include <sstream>
#include <stdexcept>

MP2Components restrictedMP2(const Eigen::MatrixXd& ovov, const Eigen::VectorXd& epsOcc, const Eigen::VectorXd& epsVir)
{
    const Eigen::Index nocc = epsOcc.size();
    const Eigen::Index nvir = epsVir.size();

    double sameSpin     = 0.0;
    double oppositeSpin = 0.0;

#pragma omp parallel for collapse(2) reduction(+ : sameSpin, oppositeSpin)
    for (Eigen::Index i = 0; i < nocc; ++i)
    {
        for (Eigen::Index j = 0; j < nocc; ++j)
        {
            for (Eigen::Index a = 0; a < nvir; ++a)
            {
                for (Eigen::Index b = 0; b < nvir; ++b)
                {
                    const double iajb  = ovov(i * nvir + a, j * nvir + b);
                    const double ibja  = ovov(i * nvir + b, j * nvir + a);
                    const double denom = epsOcc(i) + epsOcc(j) - epsVir(a) - epsVir(b);

                    oppositeSpin += iajb * iajb / denom;
                    sameSpin += iajb * (iajb - ibja) / denom;
                }
            }
        }
    }

    return {.sameSpin = sameSpin, .oppositeSpin = oppositeSpin};
}

double sameSpinMP2(const Eigen::MatrixXd& ovov, const Eigen::VectorXd& epsOcc, const Eigen::VectorXd& epsVir)
{
    const Eigen::Index nocc = epsOcc.size();
    const Eigen::Index nvir = epsVir.size();

    double energy = 0.0;

#pragma omp parallel for collapse(2) reduction(+ : energy)
    for (Eigen::Index i = 0; i < nocc; ++i)
    {
        for (Eigen::Index j = 0; j < nocc; ++j)
        {
            for (Eigen::Index a = 0; a < nvir; ++a)
            {
                for (Eigen::Index b = 0; b < nvir; ++b)
                {
                    const double iajb = ovov(i * nvir + a, j * nvir + b);
                    const double ibja = ovov(i * nvir + b, j * nvir + a);
                    energy += iajb * (iajb - ibja) / (epsOcc(i) + epsOcc(j) - epsVir(a) - epsVir(b));
                }
            }
        }
    }

    return 0.5 * energy;
}

double oppositeSpinMP2(
    const Eigen::MatrixXd& ovOV,
    const Eigen::VectorXd& epsOccAlpha,
    const Eigen::VectorXd& epsVirAlpha,
    const Eigen::VectorXd& epsOccBeta,
    const Eigen::VectorXd& epsVirBeta
)
{
    const Eigen::Index noccA = epsOccAlpha.size();
    const Eigen::Index nvirA = epsVirAlpha.size();
    const Eigen::Index noccB = epsOccBeta.size();
    const Eigen::Index nvirB = epsVirBeta.size();

    double energy = 0.0;

#pragma omp parallel for collapse(2) reduction(+ : energy)
    for (Eigen::Index i = 0; i < noccA; ++i)
    {
        for (Eigen::Index a = 0; a < nvirA; ++a)
        {
            for (Eigen::Index j = 0; j < noccB; ++j)
            {
                for (Eigen::Index b = 0; b < nvirB; ++b)
                {
                    const double iajb = ovOV(i * nvirA + a, j * nvirB + b);
                    energy += iajb * iajb / (epsOccAlpha(i) + epsOccBeta(j) - epsVirAlpha(a) - epsVirBeta(b));
                }
            }
        }
    }

    return energy;
}


MP2::MP2(
    const SCFResults& scfResults, const IntegralSet& integrals, const MP2Options& options, std::shared_ptr<Output> output
) :
    output(output),
    scfResults(scfResults),
    integrals(integrals),
    options(options)
{
}

MP2Results MP2::run()
{
    if (!this->scfResults.converged)
        throw std::runtime_error("MP2 requires a converged SCF reference.");

    const size_t nbf   = this->integrals.basisCount;
    const size_t noccA = this->scfResults.occupiedCountAlpha;
    const size_t noccB = this->scfResults.occupiedCountBeta;
    if (noccA >= nbf && noccB >= nbf)
        throw std::runtime_error("MP2 requires at least one virtual orbital.");

    if (this->options.densityFitting)
    {
        if (!this->integrals.densityFitting)
            throw std::runtime_error("Density-fitted MP2 requested but the integral file has no density-fitting integrals.");
        this->densityFitting = buildDensityFittingTensor(*this->integrals.densityFitting, nbf);
    }

    this->output->writeBanner(this->options.densityFitting ? "DF-MP2" : "MP2");

    const Eigen::MatrixXd& C_alpha = this->scfResults.C_alpha;
    const Eigen::MatrixXd& C_beta  = this->scfResults.C_beta;
    const Eigen::VectorXd& e_alpha = this->scfResults.eigenvalues_alpha;
    const Eigen::VectorXd& e_beta  = this->scfResults.eigenvalues_beta;

    MP2Results results;
    if (!this->scfResults.unrestricted)
    {
        const Eigen::MatrixXd C_occ = C_alpha.leftCols(noccA);
        const Eigen::MatrixXd C_vir = C_alpha.rightCols(nbf - noccA);
        const Eigen::MatrixXd ovov  = this->ovovIntegrals(C_occ, C_vir, C_occ, C_vir);

        MP2Components components   = restrictedMP2(ovov, e_alpha.head(noccA), e_alpha.tail(nbf - noccA));
        results.sameSpinEnergy     = components.sameSpin;
        results.oppositeSpinEnergy = components.oppositeSpin;
    }
    else
    {
        const Eigen::MatrixXd C_occA = C_alpha.leftCols(noccA);
        const Eigen::MatrixXd C_virA = C_alpha.rightCols(nbf - noccA);
        const Eigen::MatrixXd C_occB = C_beta.leftCols(noccB);
        const Eigen::MatrixXd C_virB = C_beta.rightCols(nbf - noccB);

        const Eigen::VectorXd epsOccA = e_alpha.head(noccA);
        const Eigen::VectorXd epsVirA = e_alpha.tail(nbf - noccA);
        const Eigen::VectorXd epsOccB = e_beta.head(noccB);
        const Eigen::VectorXd epsVirB = e_beta.tail(nbf - noccB);

        double sameSpin = 0.0;
        if (noccA > 0 && noccA < nbf)
            sameSpin += sameSpinMP2(this->ovovIntegrals(C_occA, C_virA, C_occA, C_virA), epsOccA, epsVirA);
        if (noccB > 0 && noccB < nbf)
            sameSpin += sameSpinMP2(this->ovovIntegrals(C_occB, C_virB, C_occB, C_virB), epsOccB, epsVirB);

        double oppositeSpin = 0.0;
        if (noccA > 0 && noccA < nbf && noccB > 0 && noccB < nbf)
        {
            oppositeSpin = oppositeSpinMP2(
                this->ovovIntegrals(C_occA, C_virA, C_occB, C_virB), epsOccA, epsVirA, epsOccB, epsVirB
            );
        }

        results.sameSpinEnergy     = sameSpin;
        results.oppositeSpinEnergy = oppositeSpin;
    }

    results.correlationEnergy    = results.sameSpinEnergy + results.oppositeSpinEnergy;
    results.totalEnergy          = this->scfResults.totalEnergy + results.correlationEnergy;
    results.SCSCorrelationEnergy = this->options.ssScale * results.sameSpinEnergy
                                 + this->options.osScale * results.oppositeSpinEnergy;
    results.SCSTotalEnergy = this->scfResults.totalEnergy + results.SCSCorrelationEnergy;

    this->printResults(results);
    return results;
}

Eigen::MatrixXd MP2::ovovIntegrals(
    const Eigen::MatrixXd& C_occ1, const Eigen::MatrixXd& C_vir1, const Eigen::MatrixXd& C_occ2, const Eigen::MatrixXd& C_vir2
) const
{
    if (this->densityFitting)
    {
        // (ia|jb) ~ sum_Q B_Q,ia B_Q,jb
        const Eigen::MatrixXd B_ov1 = transformDensityFitting(*this->densityFitting, C_occ1, C_vir1);
        const Eigen::MatrixXd B_ov2 = transformDensityFitting(*this->densityFitting, C_occ2, C_vir2);
        return B_ov1 * B_ov2.transpose();
    }
    return transformERI(this->integrals.eri, C_occ1, C_vir1, C_occ2, C_vir2);
}

void MP2::printResults(const MP2Results& results) const
{
    std::stringstream ss;
    ss << fmt::format(
        "Same-spin correlation energy:      {:>18.12f}\n"
        "Opposite-spin correlation energy:  {:>18.12f}\n"
        "MP2 correlation energy:            {:>18.12f}\n"
        "Total MP2 energy:                  {:>18.12f}\n\n"
        "SCS-MP2 (os: {:.4f}, ss: {:.4f})\n"
        "SCS-MP2 correlation energy:        {:>18.12f}\n"
        "Total SCS-MP2 energy:              {:>18.12f}\n",
        results.sameSpinEnergy,
        results.oppositeSpinEnergy,
        results.correlationEnergy,
        results.totalEnergy,
        this->options.osScale,
        this->options.ssScale,
        results.SCSCorrelationEnergy,
        results.SCSTotalEnergy
    );
    ss << fmt::format("{:-<{}}\n", "", 99);
    this->output->write(ss.str());
}
