#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

/**
 * @brief Numeric capabilities the DIIS core needs from a trial/residual array type.
 *
 * A specialisation must provide:
 *  - shape(a):        the extents of the array, one entry per dimension.
 *  - size(a):         the total number of elements.
 *  - dot(a, b):       the real inner product of the flattened arrays.
 *  - zerosLike(a):    an array of the same shape filled with zeros.
 *  - axpy(alpha, x, y): y += alpha * x, elementwise.
 *  - maxAbs(a):       the largest absolute element (0 for an empty array).
 */
template <typename T>
struct DIISTraits;

/**
 * Any real Eigen matrix or vector (Fock matrices, stacked UHF Fock matrices, plain vectors).
 */
template <int Rows, int Cols, int Options, int MaxRows, int MaxCols>
struct DIISTraits<Eigen::Matrix<double, Rows, Cols, Options, MaxRows, MaxCols>>
{
    using Array = Eigen::Matrix<double, Rows, Cols, Options, MaxRows, MaxCols>;

    static std::vector<size_t> shape(const Array& a)
    {
        return {static_cast<size_t>(a.rows()), static_cast<size_t>(a.cols())};
    }

    static size_t size(const Array& a) { return static_cast<size_t>(a.size()); }

    static double dot(const Array& a, const Array& b) { return (a.array() * b.array()).sum(); }

    static Array zerosLike(const Array& a) { return Array::Zero(a.rows(), a.cols()); }

    static void axpy(double alpha, const Array& x, Array& y) { y += alpha * x; }

    static double maxAbs(const Array& a) { return a.size() == 0 ? 0.0 : a.cwiseAbs().maxCoeff(); }
};

template <>
struct DIISTraits<std::vector<double>>
{
    using Array = std::vector<double>;

    static std::vector<size_t> shape(const Array& a) { return {a.size()}; }

    static size_t size(const Array& a) { return a.size(); }

    static double dot(const Array& a, const Array& b) { return std::inner_product(a.begin(), a.end(), b.begin(), 0.0); }

    static Array zerosLike(const Array& a) { return Array(a.size(), 0.0); }

    static void axpy(double alpha, const Array& x, Array& y)
    {
        for (size_t i = 0; i < x.size(); ++i) { y[i] += alpha * x[i]; }
    }

    static double maxAbs(const Array& a)
    {
        double result = 0.0;
        for (double value : a) { result = std::max(result, std::abs(value)); }
        return result;
    }
};
