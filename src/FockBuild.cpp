#include "FockBuild.hpp"

#include <fmt/core.h>
#include <stdexcept>

JKMatrices buildJK(
    const ElectronRepulsionTensor& eri, const Eigen::MatrixXd& D_alpha, const Eigen::MatrixXd& D_beta, bool unrestricted
)
{
    const Eigen::Index N_ao = D_alpha.rows();
    if (static_cast<size_t>(N_ao) != eri.getBasisSize() || D_beta.rows() != N_ao)
    {
        throw std::runtime_error(fmt::format(
            "Density matrix dimension {} does not match the ERI basis size {}.", N_ao, eri.getBasisSize()
        ));
    }

    const Eigen::MatrixXd D_tot = D_alpha + D_beta;

    JKMatrices jk;
    jk.J       = Eigen::MatrixXd::Zero(N_ao, N_ao);
    jk.K_alpha = Eigen::MatrixXd::Zero(N_ao, N_ao);
    if (unrestricted)
        jk.K_beta = Eigen::MatrixXd::Zero(N_ao, N_ao);

    // Every (i, j) element with i >= j is owned by exactly one iteration, so no reduction is needed.
#pragma omp parallel for schedule(dynamic)
    for (Eigen::Index i = 0; i < N_ao; ++i)
    {
        for (Eigen::Index j = 0; j <= i; ++j)
        {
            double J_ij       = 0.0;
            double K_alpha_ij = 0.0;
            double K_beta_ij  = 0.0;
            for (Eigen::Index k = 0; k < N_ao; ++k)
            {
                for (Eigen::Index l = 0; l < N_ao; ++l)
                {
                    // J_ij = (ij|kl) D_kl, K_ij = (ik|jl) D_kl
                    J_ij += eri(i, j, k, l) * D_tot(k, l);
                    const double exchange = eri(i, k, j, l);
                    K_alpha_ij += exchange * D_alpha(k, l);
                    if (unrestricted)
                        K_beta_ij += exchange * D_beta(k, l);
                }
            }
            jk.J(i, j) = jk.J(j, i) = J_ij;
            jk.K_alpha(i, j) = jk.K_alpha(j, i) = K_alpha_ij;
            if (unrestricted)
                jk.K_beta(i, j) = jk.K_beta(j, i) = K_beta_ij;
        }
    }

    if (!unrestricted)
        jk.K_beta = jk.K_alpha;

    return jk;
}


JKMatrices buildJK(
    const DensityFittingTensor& df, const Eigen::MatrixXd& D_alpha, const Eigen::MatrixXd& D_beta, bool unrestricted
)
{
    const Eigen::Index N_ao = D_alpha.rows();
    if (static_cast<size_t>(N_ao) != df.basisCount || D_beta.rows() != N_ao)
    {
        throw std::runtime_error(fmt::format(
            "Density matrix dimension {} does not match the density-fitting basis size {}.", N_ao, df.basisCount
        ));
    }

    const Eigen::Index naux     = static_cast<Eigen::Index>(df.auxCount);
    const Eigen::MatrixXd D_tot = D_alpha + D_beta;

    JKMatrices jk;

    // Coulomb: contract the density into the auxiliary index first.
    const Eigen::VectorXd X = df.B.transpose() * Eigen::Map<const Eigen::VectorXd>(D_tot.data(), N_ao * N_ao);
    const Eigen::VectorXd J = df.B * X;
    jk.J                    = Eigen::Map<const Eigen::MatrixXd>(J.data(), N_ao, N_ao);

    jk.K_alpha = Eigen::MatrixXd::Zero(N_ao, N_ao);
    if (unrestricted)
        jk.K_beta = Eigen::MatrixXd::Zero(N_ao, N_ao);

#pragma omp parallel
    {
        // Thread-local matrices to avoid data races
        Eigen::MatrixXd K_alpha_p = Eigen::MatrixXd::Zero(N_ao, N_ao);
        Eigen::MatrixXd K_beta_p;
        if (unrestricted)
            K_beta_p = Eigen::MatrixXd::Zero(N_ao, N_ao);

#pragma omp for schedule(static) nowait
        for (Eigen::Index Q = 0; Q < naux; ++Q)
        {
            Eigen::Map<const Eigen::MatrixXd> B_Q(df.B.col(Q).data(), N_ao, N_ao);
            K_alpha_p.noalias() += B_Q * D_alpha * B_Q;
            if (unrestricted)
                K_beta_p.noalias() += B_Q * D_beta * B_Q;
        }

#pragma omp critical(build_jk_density_fitted)
        {
            jk.K_alpha += K_alpha_p;
            if (unrestricted)
                jk.K_beta += K_beta_p;
        }
    }

    if (!unrestricted)
        jk.K_beta = jk.K_alpha;

    return jk;
}
