#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Represents the electron repulsion tensor (pq|rs) in chemists' notation.
 *
 * Flattened 1D vector holding only the unique elements under 8-fold permutational symmetry. The tensor can be
 * indexed normally as eri(i, j, k, l); indices are swapped automatically to the canonical order
 * (i >= j, k >= l, ij >= kl).
 */
class ElectronRepulsionTensor
{
  public:
    ElectronRepulsionTensor() = default;

    /**
     * Constructs a zero tensor for a given basis size.
     *
     * @param basisSize The number of basis functions.
     */
    explicit ElectronRepulsionTensor(size_t basisSize) : basisSize(basisSize), values(tensorSize(basisSize), 0.0) {}

    double& operator()(size_t i, size_t j, size_t k, size_t l) { return values[index(i, j, k, l)]; }

    double operator()(size_t i, size_t j, size_t k, size_t l) const { return values[index(i, j, k, l)]; }

    size_t getBasisSize() const { return basisSize; }
    size_t uniqueCount() const { return values.size(); }

    /**
     * Returns the position of (ij|kl) in the packed storage.
     */
    static size_t index(size_t i, size_t j, size_t k, size_t l)
    {
        // Enforce i >= j and k >= l
        const auto [j_, i_] = std::minmax(j, i);
        const auto [l_, k_] = std::minmax(l, k);

        const size_t big_I = i_ * (i_ + 1) / 2 + j_;
        const size_t big_K = k_ * (k_ + 1) / 2 + l_;

        // Enforce big_I >= big_K
        const auto [big_K_, big_I_] = std::minmax(big_K, big_I);

        return big_I_ * (big_I_ + 1) / 2 + big_K_;
    }

    /**
     * Returns the number of unique elements for a given basis size.
     */
    static size_t tensorSize(size_t basisSize)
    {
        // The number of unique pairs (i, j) where i >= j
        const size_t M = basisSize * (basisSize + 1) / 2;

        // The number of unique quartets (i, j, k, l) where i >= j, k >= l and (i, j) >= (k, l).
        return M * (M + 1) / 2;
    }

  private:
    size_t basisSize = 0;
    std::vector<double> values;
};


/**
 * @brief Three-index integrals (Q|pq) and the Coulomb metric (P|Q) of an auxiliary basis.
 */
struct DensityFittingIntegrals
{
    size_t auxCount = 0;
    Eigen::MatrixXd threeIndex; // nbf^2 x naux, column Q holds (Q|pq) at row p + q * nbf
    Eigen::MatrixXd metric;     // naux x naux
};

/**
 * @brief Energies computed by the external package, used to validate the results.
 */
struct ReferenceEnergies
{
    std::optional<double> scfEnergy;
    std::optional<double> mp2Energy;
};

/**
 * @brief Everything the calculation needs from the external integral package.
 */
struct IntegralSet
{
    size_t basisCount    = 0;
    size_t electronCount = 0;
    size_t multiplicity  = 1;
    double nuclearEnergy = 0.0;

    Eigen::MatrixXd S; // Overlap matrix
    Eigen::MatrixXd T; // Kinetic energy matrix
    Eigen::MatrixXd V; // Nuclear attraction matrix
    ElectronRepulsionTensor eri;

    std::optional<DensityFittingIntegrals> densityFitting;
    ReferenceEnergies reference;

    size_t occupiedCountAlpha() const { return (electronCount + multiplicity - 1) / 2; }
    size_t occupiedCountBeta() const { return (electronCount + 1 - multiplicity) / 2; }
};

/**
 * Parses an integral file.
 *
 * Layout (JSON):
 *   basis_functions, electrons, multiplicity, nuclear_repulsion,
 *   overlap, kinetic, potential          (nbf x nbf nested arrays),
 *   eri: {format: "full" | "sparse", values: [...]},
 *   density_fitting: {aux_functions, three_index, metric}   (optional),
 *   reference: {scf_energy, mp2_energy}                     (optional).
 *
 * @param contents The JSON text.
 * @throws std::runtime_error if the document is malformed or inconsistent.
 */
IntegralSet parseIntegrals(const std::string& contents);

/**
 * Reads and parses an integral file from disk.
 *
 * @param filename Path to the JSON integral file.
 */
IntegralSet readIntegralFile(const std::string& filename);
