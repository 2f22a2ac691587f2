#include "DensityFitting.hpp"

#include "Utils.hpp"

#include <fmt/core.h>
#include <stdexcept>

DensityFittingTensor buildDensityFittingTensor(const DensityFittingIntegrals& integrals, size_t basisCount)
{
    const Eigen::Index nbfSquared = static_cast<Eigen::Index>(basisCount * basisCount);
    const Eigen::Index naux       = static_cast<Eigen::Index>(integrals.auxCount);
    if (integrals.threeIndex.rows() != nbfSquared || integrals.threeIndex.cols() != naux)
    {
        throw std::runtime_error(fmt::format(
            "Three-index integrals have shape {}x{}, expected {}x{}.",
            integrals.threeIndex.rows(),
            integrals.threeIndex.cols(),
            nbfSquared,
            naux
        ));
    }
    if (integrals.metric.rows() != naux || integrals.metric.cols() != naux)
        throw std::runtime_error("The density-fitting metric does not match the number of auxiliary functions.");

    // J^(-1/2) is symmetric, so B(:, Q) = sum_P (P|pq) [J^(-1/2)]_PQ.
    const Eigen::MatrixXd metricInvSqrt = inverseSqrtMatrix(integrals.metric);

    DensityFittingTensor tensor;
    tensor.basisCount = basisCount;
    tensor.auxCount   = integrals.auxCount;
    tensor.B          = integrals.threeIndex * metricInvSqrt;
    return tensor;
}
