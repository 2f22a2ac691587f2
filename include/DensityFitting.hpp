#pragma once
#include "Integrals.hpp"

#include <Eigen/Dense>

/**
 * @brief Metric-contracted density-fitting tensor B_Q,pq = sum_P [J^(-1/2)]_QP (P|pq).
 *
 * With this tensor (pq|rs) ~ sum_Q B_Q,pq B_Q,rs.
 */
struct DensityFittingTensor
{
    size_t basisCount = 0;
    size_t auxCount   = 0;
    Eigen::MatrixXd B; // nbf^2 x naux, column Q holds B_Q,pq at row p + q * nbf
};

/**
 * Contracts the raw three-index integrals with the inverse square root of the Coulomb metric.
 *
 * @param integrals The (Q|pq) integrals and the (P|Q) metric.
 * @param basisCount The number of (primary) basis functions.
 * @return The fitted tensor B.
 */
DensityFittingTensor buildDensityFittingTensor(const DensityFittingIntegrals& integrals, size_t basisCount);
