#include "PulaySolver.hpp"

#include "DIISErrors.hpp"

#include <cmath>
#include <fmt/core.h>

PulaySolver::PulaySolver(double singularThreshold) : singularThreshold(singularThreshold) {}


Eigen::MatrixXd PulaySolver::augment(const Eigen::MatrixXd& B)
{
    const Eigen::Index size = B.rows();
    Eigen::MatrixXd A       = Eigen::MatrixXd::Zero(size + 1, size + 1);
    A.topLeftCorner(size, size) = B;

    // The last row and column are -1.
    A.row(size).setConstant(-1.0);
    A.col(size).setConstant(-1.0);
    A(size, size) = 0.0; // The bottom-right element is 0.

    return A;
}


Eigen::VectorXd PulaySolver::solve(const Eigen::MatrixXd& B) const
{
    const Eigen::Index size = B.rows();
    if (size == 0)
        throw EmptyHistory("Pulay solve requested for an empty DIIS history.");
    if (B.cols() != size)
        throw DimensionMismatch(fmt::format("DIIS overlap matrix must be square, got {}x{}.", B.rows(), B.cols()));

    if (size == 1)
        return Eigen::VectorXd::Ones(1);

    // Scaling B leaves the coefficients unchanged (only the multiplier scales) and keeps the pivots comparable.
    const double scale = B.diagonal().maxCoeff();
    if (!(scale > 0.0) || !std::isfinite(scale))
        throw SingularExtrapolation("All DIIS residuals vanish; the Pulay system is singular.");

    Eigen::MatrixXd A   = augment(B / scale);
    Eigen::VectorXd rhs = Eigen::VectorXd::Zero(size + 1);
    rhs(size)           = -1.0;

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
    qr.setThreshold(this->singularThreshold);
    if (!qr.isInvertible())
    {
        throw SingularExtrapolation(
            fmt::format("Pulay system of dimension {} is singular (numerical rank {}).", size + 1, qr.rank())
        );
    }

    Eigen::VectorXd solution = qr.solve(rhs);
    if (!solution.allFinite())
        throw SingularExtrapolation("Pulay solve produced non-finite coefficients.");

    return solution.head(size);
}
