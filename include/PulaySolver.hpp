#pragma once

#include <Eigen/Dense>

/**
 * @brief Solves Pulay's constrained least-squares problem for the DIIS extrapolation coefficients.
 *
 * Given the residual overlap matrix B, finds the coefficients c minimising || sum_i c_i r_i ||^2 subject to
 * sum_i c_i = 1 by solving the bordered system
 *
 *   | B   -1 | | c      |   |  0 |
 *   | -1   0 | | lambda | = | -1 |
 *
 * Reference: P. Pulay, Chem. Phys. Lett. 73, 393 (1980)
 */
class PulaySolver
{
  public:
    /**
     * @param singularThreshold Relative pivot threshold below which the bordered system is treated as singular.
     */
    explicit PulaySolver(double singularThreshold = 1.0e-12);

    /**
     * Borders B with a row and column of -1 and a zero corner.
     *
     * @param B The N x N residual overlap matrix.
     * @return The (N+1) x (N+1) augmented matrix.
     */
    static Eigen::MatrixXd augment(const Eigen::MatrixXd& B);

    /**
     * Computes the extrapolation coefficients. A single entry short-circuits to [1.0].
     *
     * @param B The N x N residual overlap matrix (N >= 1).
     * @return The N coefficients (the Lagrange multiplier is discarded). They sum to one and may be negative.
     * @throws EmptyHistory if B is empty.
     * @throws SingularExtrapolation if the residuals are linearly dependent or all zero.
     */
    Eigen::VectorXd solve(const Eigen::MatrixXd& B) const;

    double getSingularThreshold() const { return singularThreshold; }

  private:
    double singularThreshold;
};
