#pragma once

#include <complex>
#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "powersim/engine.hpp"

namespace powersim {

/**
 * @brief Convert a double to a JSON number; NaN and infinities become null.
 */
nlohmann::json toJsonScalar(double value);

nlohmann::json toJsonArray(const std::vector<double>& values);

nlohmann::json toJsonArray(const std::vector<std::string>& values);

nlohmann::json toJsonArray(const std::vector<ElementId>& ids);

nlohmann::json toJsonId(const ElementId& id);

// Nested row arrays.
nlohmann::json toJsonMatrix(const DenseMatrix& matrix);

std::vector<double> extractColumn(const DenseMatrix& matrix, std::size_t column);

struct ComplexParts {
    std::vector<double> real;
    std::vector<double> imag;
};

ComplexParts splitComplex(const std::vector<std::complex<double>>& values);

}  // namespace powersim
