#include "powersim/numeric.hpp"

#include <cmath>
#include <stdexcept>
#include <variant>

namespace powersim {

nlohmann::json toJsonScalar(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

nlohmann::json toJsonArray(const std::vector<double>& values) {
    nlohmann::json out = nlohmann::json::array();
    for (const double v : values) {
        out.push_back(toJsonScalar(v));
    }
    return out;
}

nlohmann::json toJsonArray(const std::vector<std::string>& values) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& v : values) {
        out.push_back(v);
    }
    return out;
}

nlohmann::json toJsonId(const ElementId& id) {
    return std::visit(
        [](const auto& value) -> nlohmann::json {
            return nlohmann::json(value);
        },
        id);
}

nlohmann::json toJsonArray(const std::vector<ElementId>& ids) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& id : ids) {
        out.push_back(toJsonId(id));
    }
    return out;
}

nlohmann::json toJsonMatrix(const DenseMatrix& matrix) {
    if (matrix.data.size() != matrix.rows * matrix.cols) {
        throw std::invalid_argument("toJsonMatrix: data size does not match matrix shape");
    }
    nlohmann::json rows = nlohmann::json::array();
    for (std::size_t r = 0; r < matrix.rows; ++r) {
        nlohmann::json row = nlohmann::json::array();
        for (std::size_t c = 0; c < matrix.cols; ++c) {
            row.push_back(toJsonScalar(matrix.data[matrix.idx(r, c)]));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<double> extractColumn(const DenseMatrix& matrix, std::size_t column) {
    if (column >= matrix.cols) {
        throw std::out_of_range("extractColumn: column " + std::to_string(column) + " out of range");
    }
    std::vector<double> out;
    out.reserve(matrix.rows);
    for (std::size_t r = 0; r < matrix.rows; ++r) {
        out.push_back(matrix.data[matrix.idx(r, column)]);
    }
    return out;
}

ComplexParts splitComplex(const std::vector<std::complex<double>>& values) {
    ComplexParts parts;
    parts.real.reserve(values.size());
    parts.imag.reserve(values.size());
    for (const auto& v : values) {
        parts.real.push_back(v.real());
        parts.imag.push_back(v.imag());
    }
    return parts;
}

}  // namespace powersim
