#pragma once
#include "DIISErrors.hpp"
#include "DIISHistory.hpp"
#include "DIISTraits.hpp"
#include "PulaySolver.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <string>

/**
 * @brief Direct Inversion in the Iterative Subspace (DIIS) extrapolator.
 *
 * Keeps a history of trial vectors and their residuals and returns the linear combination of the stored trial
 * vectors whose combined residual has the smallest norm (with coefficients summing to one). The extrapolator never
 * decides convergence; it only exposes the size of the latest residual.
 *
 * A singular Pulay system is not an error for the caller: the latest trial vector is returned unmodified, the event is
 * counted, and the oldest pairs are dropped until the remaining history is independent again.
 */
template <typename T, typename Traits = DIISTraits<T>>
class DIIS
{
  public:
    /**
     * @param maxSize Maximum number of trial/residual pairs kept (0 = unbounded).
     * @param singularThreshold Relative pivot threshold used to detect a singular Pulay system.
     */
    explicit DIIS(size_t maxSize = 8, double singularThreshold = 1.0e-12) :
        history(maxSize),
        solver(singularThreshold)
    {
    }

    /*
     * Stores a trial/residual pair without extrapolating.
     *
     * @param trial The latest trial vector.
     * @param residual The residual of the latest trial vector.
     */
    void update(const T& trial, const T& residual) { this->history.append(trial, residual); }

    /*
     * Extrapolates from the stored history.
     *
     * @return sum_i c_i * trial_i, or the latest trial vector when there is only one entry or the Pulay system is
     *         singular.
     */
    T extrapolate()
    {
        if (this->history.empty())
            throw EmptyHistory("DIIS extrapolation requested before any trial vector was stored.");

        const size_t n    = this->history.size();
        const T& latest   = this->history.getTrial(n - 1);
        this->extrapolated = false;
        this->coefficients.resize(0);

        // Nothing to extrapolate from a single point.
        if (n < 2)
            return latest;

        Eigen::VectorXd coeffs;
        try
        {
            coeffs = this->solver.solve(this->history.getOverlapMatrix());
        }
        catch (const SingularExtrapolation& e)
        {
            ++this->fallbackCount;
            this->lastFailure = e.what();
            T fallback        = latest;
            this->pruneDependent();
            return fallback;
        }

        T result = Traits::zerosLike(latest);
        for (size_t i = 0; i < n; ++i) { Traits::axpy(coeffs(i), this->history.getTrial(i), result); }

        this->coefficients = coeffs;
        this->extrapolated = true;
        return result;
    }

    /*
     * Appends the pair and returns the extrapolated trial vector (update followed by extrapolate).
     */
    T step(const T& trial, const T& residual)
    {
        this->update(trial, residual);
        return this->extrapolate();
    }

    /*
     * Returns the root-mean-square of the latest residual, sqrt(mean(r^2)).
     *
     * @return The RMS of the last residual, or 0 if nothing has been stored.
     */
    double getErrorRMS() const
    {
        if (this->history.empty())
            return 0.0;

        const T& residual = this->history.getResidual(this->history.size() - 1);
        const size_t size = Traits::size(residual);
        if (size == 0)
            return 0.0;
        return std::sqrt(Traits::dot(residual, residual) / static_cast<double>(size));
    }

    /*
     * Returns the largest absolute element of the latest residual.
     */
    double getErrorMax() const
    {
        if (this->history.empty())
            return 0.0;
        return Traits::maxAbs(this->history.getResidual(this->history.size() - 1));
    }

    // Coefficients used by the last extrapolation (empty if the last call did not extrapolate).
    const Eigen::VectorXd& getCoefficients() const { return coefficients; }
    bool lastStepExtrapolated() const { return extrapolated; }
    size_t getFallbackCount() const { return fallbackCount; }
    const std::string& getLastFailure() const { return lastFailure; }
    const DIISHistory<T, Traits>& getHistory() const { return history; }

    void reset()
    {
        this->history.clear();
        this->coefficients.resize(0);
        this->extrapolated  = false;
        this->fallbackCount = 0;
        this->lastFailure.clear();
    }

  private:
    /*
     * Drops the oldest pairs until the remaining Pulay system solves or a single pair is left.
     */
    void pruneDependent()
    {
        while (this->history.size() > 1)
        {
            this->history.evictOldest();
            if (this->history.size() < 2)
                break;
            try
            {
                this->solver.solve(this->history.getOverlapMatrix());
                break;
            }
            catch (const SingularExtrapolation&)
            {
                // Still dependent, drop another one.
            }
        }
    }

    DIISHistory<T, Traits> history;
    PulaySolver solver;
    Eigen::VectorXd coefficients;
    bool extrapolated    = false;
    size_t fallbackCount = 0; // Number of singular Pulay systems recovered from
    std::string lastFailure;
};
