#pragma once
#include "DensityFitting.hpp"
#include "Integrals.hpp"

#include <Eigen/Dense>

/**
 * Transforms the AO electron repulsion integrals to an MO basis, (pq|rs) = sum C1_mp C2_nq (mn|ls) C3_lr C4_ss.
 *
 * The transformation is done as two half transformations: first the bra pair for every AO ket pair, then the ket
 * pair for every MO bra pair. Each of C1..C4 has one row per basis function and one column per MO.
 *
 * @return A (n1 * n2) x (n3 * n4) matrix; element (p * n2 + q, r * n4 + s) is (pq|rs).
 */
Eigen::MatrixXd transformERI(
    const ElectronRepulsionTensor& eri,
    const Eigen::MatrixXd& C1,
    const Eigen::MatrixXd& C2,
    const Eigen::MatrixXd& C3,
    const Eigen::MatrixXd& C4
);

/**
 * Transforms the density-fitted tensor to an MO pair basis, B_Q,pq = (C1^T B_Q C2)_pq.
 *
 * @return A (n1 * n2) x naux matrix; row p * n2 + q holds B_Q,pq for every Q, so that
 *         (pq|rs) ~ (B B'^T)(p * n2 + q, r * n4 + s).
 */
Eigen::MatrixXd transformDensityFitting(const DensityFittingTensor& df, const Eigen::MatrixXd& C1, const Eigen::MatrixXd& C2);
