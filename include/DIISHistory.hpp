#pragma once
#include "DIISErrors.hpp"
#include "DIISTraits.hpp"

#include <Eigen/Dense>
#include <deque>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <vector>

/**
 * @brief Ordered record of (trial, residual) pairs used by the DIIS extrapolator.
 *
 * Pairs are kept in insertion (iteration) order. The residual overlap matrix B_ij = <r_i | r_j> is extended by one
 * row and column on every append and shrunk when the oldest pair is evicted, so it never has to be rebuilt.
 * A maximum size of 0 means the history is unbounded.
 */
template <typename T, typename Traits = DIISTraits<T>>
class DIISHistory
{
  public:
    explicit DIISHistory(size_t maxSize = 0) : maxSize(maxSize) {}

    /**
     * Appends a trial/residual pair. If the history is bounded and full, the oldest pair is evicted first.
     *
     * @param trial The trial vector (e.g. a Fock matrix).
     * @param residual The residual (error) vector belonging to the trial vector.
     * @throws DimensionMismatch if the residual shape differs from the trial shape, or from the stored pairs.
     */
    void append(const T& trial, const T& residual)
    {
        std::vector<size_t> trialShape = Traits::shape(trial);
        std::vector<size_t> residualShape = Traits::shape(residual);
        if (residualShape != trialShape)
        {
            throw DimensionMismatch(fmt::format(
                "DIIS residual shape ({}) does not match trial shape ({}).",
                fmt::join(residualShape, ", "),
                fmt::join(trialShape, ", ")
            ));
        }
        if (!this->trials.empty() && trialShape != this->shape)
        {
            throw DimensionMismatch(fmt::format(
                "DIIS trial shape ({}) does not match the shape of the stored history ({}).",
                fmt::join(trialShape, ", "),
                fmt::join(this->shape, ", ")
            ));
        }

        if (this->maxSize > 0 && this->trials.size() >= this->maxSize)
            this->evictOldest();

        this->trials.push_back(trial);
        this->residuals.push_back(residual);
        this->shape = std::move(trialShape);

        // Extend B with the overlaps of the new residual.
        const Eigen::Index n = static_cast<Eigen::Index>(this->residuals.size());
        this->B.conservativeResize(n, n);
        const T& newest = this->residuals.back();
        for (Eigen::Index i = 0; i < n; ++i)
        {
            const double overlap = Traits::dot(this->residuals[i], newest);
            this->B(i, n - 1)    = overlap;
            this->B(n - 1, i)    = overlap;
        }
    }

    /**
     * Drops the oldest pair, keeping the relative order of the remaining ones.
     *
     * @throws EmptyHistory if there is nothing to evict.
     */
    void evictOldest()
    {
        if (this->trials.empty())
            throw EmptyHistory("Cannot evict from an empty DIIS history.");

        this->trials.pop_front();
        this->residuals.pop_front();

        const Eigen::Index n = this->B.rows() - 1;
        Eigen::MatrixXd shrunk = this->B.bottomRightCorner(n, n);
        this->B = std::move(shrunk);

        if (this->trials.empty())
            this->shape.clear();
    }

    void clear()
    {
        this->trials.clear();
        this->residuals.clear();
        this->B.resize(0, 0);
        this->shape.clear();
    }

    size_t size() const { return this->trials.size(); }
    bool empty() const { return this->trials.empty(); }
    size_t getMaxSize() const { return this->maxSize; }

    const T& getTrial(size_t i) const { return this->trials.at(i); }
    const T& getResidual(size_t i) const { return this->residuals.at(i); }

    /**
     * @return The symmetric residual overlap matrix B_ij = <r_i | r_j>, of dimension size() x size().
     */
    const Eigen::MatrixXd& getOverlapMatrix() const { return this->B; }

  private:
    size_t maxSize;              // 0 = unbounded
    std::deque<T> trials;        // Trial vectors, oldest first
    std::deque<T> residuals;     // Residual vectors, same order as trials
    Eigen::MatrixXd B;           // Residual overlaps
    std::vector<size_t> shape;   // Shape shared by every stored array
};
