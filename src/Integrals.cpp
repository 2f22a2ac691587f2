#include "Integrals.hpp"

#include <cmath>
#include <fmt/core.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

namespace
{

const nlohmann::json& requireField(const nlohmann::json& object, const std::string& key)
{
    auto it = object.find(key);
    if (it == object.end())
        throw std::runtime_error("Integral file is missing the \"" + key + "\" field.");
    return *it;
}

Eigen::MatrixXd readMatrix(const nlohmann::json& document, const std::string& key, size_t rows, size_t cols)
{
    const nlohmann::json& field = requireField(document, key);
    if (!field.is_array() || field.size() != rows)
        throw std::runtime_error(fmt::format("Integral field \"{}\" must be an array of {} rows.", key, rows));

    Eigen::MatrixXd matrix(rows, cols);
    for (size_t i = 0; i < rows; ++i)
    {
        const nlohmann::json& row = field[i];
        if (!row.is_array() || row.size() != cols)
            throw std::runtime_error(fmt::format("Row {} of \"{}\" must have {} entries.", i + 1, key, cols));
        for (size_t j = 0; j < cols; ++j) { matrix(i, j) = row[j].get<double>(); }
    }
    return matrix;
}

ElectronRepulsionTensor readERI(const nlohmann::json& document, size_t nbf)
{
    const nlohmann::json& eriField = requireField(document, "eri");
    const std::string format       = eriField.value("format", std::string("full"));
    const nlohmann::json& values   = requireField(eriField, "values");
    if (!values.is_array())
        throw std::runtime_error("Integral field \"eri.values\" must be an array.");

    ElectronRepulsionTensor eri(nbf);
    if (format == "full")
    {
        const size_t expected = nbf * nbf * nbf * nbf;
        if (values.size() != expected)
        {
            throw std::runtime_error(
                fmt::format("\"eri.values\" holds {} entries, expected nbf^4 = {}.", values.size(), expected)
            );
        }

        // Only the canonical quartets are read; the others are symmetry copies.
        size_t index = 0;
        for (size_t i = 0; i < nbf; ++i)
            for (size_t j = 0; j < nbf; ++j)
                for (size_t k = 0; k < nbf; ++k)
                    for (size_t l = 0; l < nbf; ++l, ++index)
                    {
                        if (j <= i && l <= k && (i * (i + 1) / 2 + j) >= (k * (k + 1) / 2 + l))
                            eri(i, j, k, l) = values[index].get<double>();
                    }
    }
    else if (format == "sparse")
    {
        for (const auto& entry : values)
        {
            if (!entry.is_array() || entry.size() != 5)
                throw std::runtime_error("Sparse ERI entries must have the form [p, q, r, s, value].");

            const size_t p = entry[0].get<size_t>();
            const size_t q = entry[1].get<size_t>();
            const size_t r = entry[2].get<size_t>();
            const size_t s = entry[3].get<size_t>();
            if (p >= nbf || q >= nbf || r >= nbf || s >= nbf)
                throw std::runtime_error(fmt::format("Sparse ERI index ({} {} | {} {}) out of range.", p, q, r, s));
            eri(p, q, r, s) = entry[4].get<double>();
        }
    }
    else
    {
        throw std::runtime_error("Unknown ERI format \"" + format + "\". Expected \"full\" or \"sparse\".");
    }
    return eri;
}

DensityFittingIntegrals readDensityFitting(const nlohmann::json& field, size_t nbf)
{
    DensityFittingIntegrals df;
    df.auxCount = requireField(field, "aux_functions").get<size_t>();
    if (df.auxCount == 0)
        throw std::runtime_error("\"density_fitting.aux_functions\" must be positive.");

    const nlohmann::json& threeIndex = requireField(field, "three_index");
    const size_t expected            = df.auxCount * nbf * nbf;
    if (!threeIndex.is_array() || threeIndex.size() != expected)
    {
        throw std::runtime_error(
            fmt::format("\"density_fitting.three_index\" must hold naux * nbf^2 = {} entries.", expected)
        );
    }

    // Stored on disk as (Q, p, q) row-major.
    df.threeIndex.resize(nbf * nbf, df.auxCount);
    size_t index = 0;
    for (size_t Q = 0; Q < df.auxCount; ++Q)
        for (size_t p = 0; p < nbf; ++p)
            for (size_t q = 0; q < nbf; ++q, ++index) { df.threeIndex(p + q * nbf, Q) = threeIndex[index].get<double>(); }

    df.metric = readMatrix(field, "metric", df.auxCount, df.auxCount);
    return df;
}

} // namespace


IntegralSet parseIntegrals(const std::string& contents)
{
    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(contents);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw std::runtime_error(std::string("Could not parse integral file: ") + e.what());
    }

    IntegralSet integrals;
    try
    {
        integrals.basisCount    = requireField(document, "basis_functions").get<size_t>();
        integrals.electronCount = requireField(document, "electrons").get<size_t>();
        integrals.multiplicity  = document.value("multiplicity", size_t {1});
        integrals.nuclearEnergy = requireField(document, "nuclear_repulsion").get<double>();

        const size_t nbf = integrals.basisCount;
        if (nbf == 0)
            throw std::runtime_error("\"basis_functions\" must be positive.");

        integrals.S   = readMatrix(document, "overlap", nbf, nbf);
        integrals.T   = readMatrix(document, "kinetic", nbf, nbf);
        integrals.V   = readMatrix(document, "potential", nbf, nbf);
        integrals.eri = readERI(document, nbf);

        if (auto it = document.find("density_fitting"); it != document.end())
            integrals.densityFitting = readDensityFitting(*it, nbf);

        if (auto it = document.find("reference"); it != document.end())
        {
            if (it->contains("scf_energy"))
                integrals.reference.scfEnergy = it->at("scf_energy").get<double>();
            if (it->contains("mp2_energy"))
                integrals.reference.mp2Energy = it->at("mp2_energy").get<double>();
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::runtime_error(std::string("Invalid integral file: ") + e.what());
    }

    // --- Consistency checks ---
    if (!integrals.S.isApprox(integrals.S.transpose(), 1e-10))
        throw std::runtime_error("The overlap matrix in the integral file is not symmetric.");

    if (integrals.multiplicity == 0)
        throw std::runtime_error("\"multiplicity\" must be positive.");

    if (integrals.electronCount + 1 < integrals.multiplicity
        || (integrals.electronCount + integrals.multiplicity) % 2 == 0)
        throw std::runtime_error("Invalid combination of electron count and multiplicity in the integral file.");

    if (integrals.occupiedCountAlpha() > integrals.basisCount)
    {
        throw std::runtime_error(fmt::format(
            "{} alpha electrons do not fit in {} basis functions.", integrals.occupiedCountAlpha(), integrals.basisCount
        ));
    }

    return integrals;
}

IntegralSet readIntegralFile(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open integral file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseIntegrals(buffer.str());
}
