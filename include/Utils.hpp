#pragma once

#include <Eigen/Dense>
#include <string>
#include <string_view>

namespace Utils
{
/**
 * Lower-cases a string (ASCII), used for case-insensitive keywords.
 */
std::string toLowerString(std::string_view sv);

/**
 * Interprets "true"/"1" and "false"/"0" (case-insensitive).
 *
 * @param value The token to interpret.
 * @param result Set to the parsed value on success.
 * @return False if the token is not a boolean.
 */
bool parseBool(std::string_view value, bool& result);
} // namespace Utils

/**
 * @brief Result of comparing a computed energy with a reference value.
 */
struct EnergyComparison
{
    std::string label;
    double computed;
    double reference;
    double difference; // computed - reference
    bool passed;
};

/**
 * Compares a computed energy with a reference energy.
 *
 * @param label A short description printed in the report (e.g. "SCF energy").
 * @param computed The computed value.
 * @param reference The reference value from the external package.
 * @param tolerance The largest accepted absolute difference.
 */
EnergyComparison compareEnergy(const std::string& label, double computed, double reference, double tolerance);

/**
 * @return A one-line report of the comparison.
 */
std::string formatComparison(const EnergyComparison& comparison);

/*
 * Compute the inverse square root of a symmetric positive definite matrix S.
 * This is used for symmetric orthogonalization (Löwdin orthogonalization) and for the density-fitting metric.
 * Eigenvalues that are not positive are dropped.
 *
 * @param S The symmetric positive definite matrix.
 * @return The inverse square root matrix S^(-1/2).
 */
Eigen::MatrixXd inverseSqrtMatrix(const Eigen::MatrixXd& S);
