#pragma once
#include "DensityFitting.hpp"
#include "Integrals.hpp"

#include <Eigen/Dense>

/**
 * @brief Coulomb and exchange matrices for one density.
 *
 * J is built from the total density D_alpha + D_beta, K_alpha and K_beta from the spin densities, so that
 * F_sigma = h + J - K_sigma.
 */
struct JKMatrices
{
    Eigen::MatrixXd J;
    Eigen::MatrixXd K_alpha;
    Eigen::MatrixXd K_beta;
};

/**
 * Builds J and K from the stored four-index integrals.
 *
 * @param eri The electron repulsion tensor.
 * @param D_alpha The alpha density matrix (C_occ C_occ^T).
 * @param D_beta The beta density matrix.
 * @param unrestricted If false, D_beta is assumed equal to D_alpha and K_beta is a copy of K_alpha.
 */
JKMatrices buildJK(
    const ElectronRepulsionTensor& eri, const Eigen::MatrixXd& D_alpha, const Eigen::MatrixXd& D_beta, bool unrestricted
);

/**
 * Builds J and K from the density-fitted tensor:
 *   J_pq = sum_Q B_Q,pq (sum_rs B_Q,rs D_rs),   K = sum_Q B_Q D B_Q.
 */
JKMatrices buildJK(
    const DensityFittingTensor& df, const Eigen::MatrixXd& D_alpha, const Eigen::MatrixXd& D_beta, bool unrestricted
);
