#include "MOTransform.hpp"

#include <fmt/core.h>
#include <stdexcept>

namespace
{
void checkCoefficients(const Eigen::MatrixXd& C, size_t basisCount, const char* name)
{
    if (static_cast<size_t>(C.rows()) != basisCount)
    {
        throw std::runtime_error(
            fmt::format("Coefficient matrix {} has {} rows, expected {} (basis functions).", name, C.rows(), basisCount)
        );
    }
}
} // namespace


Eigen::MatrixXd transformERI(
    const ElectronRepulsionTensor& eri,
    const Eigen::MatrixXd& C1,
    const Eigen::MatrixXd& C2,
    const Eigen::MatrixXd& C3,
    const Eigen::MatrixXd& C4
)
{
    const size_t nbf = eri.getBasisSize();
    checkCoefficients(C1, nbf, "C1");
    checkCoefficients(C2, nbf, "C2");
    checkCoefficients(C3, nbf, "C3");
    checkCoefficients(C4, nbf, "C4");

    const Eigen::Index N_ao = static_cast<Eigen::Index>(nbf);
    const Eigen::Index n1 = C1.cols(), n2 = C2.cols(), n3 = C3.cols(), n4 = C4.cols();

    // First half: (pq|ls) for every AO ket pair, column l * N_ao + s.
    Eigen::MatrixXd half(n1 * n2, N_ao * N_ao);

#pragma omp parallel
    {
        Eigen::MatrixXd aoBlock(N_ao, N_ao);
        Eigen::MatrixXd moBlock(n1, n2);

#pragma omp for schedule(dynamic)
        for (Eigen::Index l = 0; l < N_ao; ++l)
        {
            for (Eigen::Index s = 0; s <= l; ++s)
            {
                for (Eigen::Index m = 0; m < N_ao; ++m)
                    for (Eigen::Index n = 0; n < N_ao; ++n) { aoBlock(m, n) = eri(m, n, l, s); }

                moBlock.noalias() = C1.transpose() * aoBlock * C2;
                for (Eigen::Index p = 0; p < n1; ++p)
                {
                    for (Eigen::Index q = 0; q < n2; ++q)
                    {
                        half(p * n2 + q, l * N_ao + s) = moBlock(p, q);
                        half(p * n2 + q, s * N_ao + l) = moBlock(p, q);
                    }
                }
            }
        }
    }

    // Second half: (pq|rs) for every MO bra pair.
    Eigen::MatrixXd result(n1 * n2, n3 * n4);

#pragma omp parallel
    {
        Eigen::MatrixXd aoBlock(N_ao, N_ao);
        Eigen::MatrixXd moBlock(n3, n4);

#pragma omp for schedule(static)
        for (Eigen::Index pq = 0; pq < n1 * n2; ++pq)
        {
            for (Eigen::Index l = 0; l < N_ao; ++l)
                for (Eigen::Index s = 0; s < N_ao; ++s) { aoBlock(l, s) = half(pq, l * N_ao + s); }

            moBlock.noalias() = C3.transpose() * aoBlock * C4;
            for (Eigen::Index r = 0; r < n3; ++r)
                for (Eigen::Index s = 0; s < n4; ++s) { result(pq, r * n4 + s) = moBlock(r, s); }
        }
    }

    return result;
}


Eigen::MatrixXd transformDensityFitting(const DensityFittingTensor& df, const Eigen::MatrixXd& C1, const Eigen::MatrixXd& C2)
{
    checkCoefficients(C1, df.basisCount, "C1");
    checkCoefficients(C2, df.basisCount, "C2");

    const Eigen::Index N_ao = static_cast<Eigen::Index>(df.basisCount);
    const Eigen::Index naux = static_cast<Eigen::Index>(df.auxCount);
    const Eigen::Index n1 = C1.cols(), n2 = C2.cols();

    Eigen::MatrixXd result(n1 * n2, naux);

#pragma omp parallel
    {
        Eigen::MatrixXd moBlock(n1, n2);

#pragma omp for schedule(static)
        for (Eigen::Index Q = 0; Q < naux; ++Q)
        {
            Eigen::Map<const Eigen::MatrixXd> B_Q(df.B.col(Q).data(), N_ao, N_ao);
            moBlock.noalias() = C1.transpose() * B_Q * C2;
            for (Eigen::Index p = 0; p < n1; ++p)
                for (Eigen::Index q = 0; q < n2; ++q) { result(p * n2 + q, Q) = moBlock(p, q); }
        }
    }

    return result;
}
