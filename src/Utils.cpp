#include "Utils.hpp"

#include <cctype>
#include <cmath>
#include <fmt/core.h>
#include <ranges>
#include <string>

namespace Utils
{

std::string toLowerString(std::string_view sv)
{
    auto view = sv | std::ranges::views::transform([](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::string(view.begin(), view.end());
}

bool parseBool(std::string_view value, bool& result)
{
    std::string lower = toLowerString(value);
    if (lower == "true" || lower == "1")
    {
        result = true;
        return true;
    }
    if (lower == "false" || lower == "0")
    {
        result = false;
        return true;
    }
    return false;
}

} // namespace Utils


EnergyComparison compareEnergy(const std::string& label, double computed, double reference, double tolerance)
{
    const double difference = computed - reference;
    return {
        .label      = label,
        .computed   = computed,
        .reference  = reference,
        .difference = difference,
        .passed     = std::abs(difference) <= tolerance,
    };
}

std::string formatComparison(const EnergyComparison& comparison)
{
    return fmt::format(
        "{:<20} computed: {:>18.12f}   reference: {:>18.12f}   difference: {:>10.3e}   {}\n",
        comparison.label,
        comparison.computed,
        comparison.reference,
        comparison.difference,
        comparison.passed ? "PASSED" : "FAILED"
    );
}


Eigen::MatrixXd inverseSqrtMatrix(const Eigen::MatrixXd& S)
{
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(S);
    const Eigen::VectorXd& eigenvalues  = solver.eigenvalues();
    const Eigen::MatrixXd& eigenvectors = solver.eigenvectors();

    Eigen::VectorXd sqrtInvEigenvalues(eigenvalues.size());
    for (int i = 0; i < eigenvalues.size(); ++i)
    {
        if (eigenvalues(i) > 0)
        {
            sqrtInvEigenvalues(i) = 1.0 / std::sqrt(eigenvalues(i));
        }
        else
        {
            // Drop (near) linear dependencies.
            sqrtInvEigenvalues(i) = 0;
        }
    }

    return eigenvectors * sqrtInvEigenvalues.asDiagonal() * eigenvectors.transpose();
}
