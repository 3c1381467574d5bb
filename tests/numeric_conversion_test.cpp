#include "powersim/numeric.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>

int main() {
    using namespace powersim;
    using nlohmann::json;

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    const json scalars = toJsonArray(std::vector<double>{1.5, nan, -inf, inf, -0.25});
    if (scalars != json::parse("[1.5, null, null, null, -0.25]")) {
        std::cerr << "Non-finite values must serialize as null, got " << scalars.dump() << '\n';
        return 1;
    }
    if (!toJsonScalar(nan).is_null() || toJsonScalar(2.0) != json(2.0)) {
        std::cerr << "toJsonScalar mismatch\n";
        return 1;
    }
    // dump() must never produce NaN/Infinity tokens.
    const std::string text = scalars.dump();
    if (text.find("nan") != std::string::npos || text.find("inf") != std::string::npos) {
        std::cerr << "Serialized text contains a non-finite token: " << text << '\n';
        return 1;
    }

    const std::vector<ElementId> ids{ElementId{std::int64_t{7}}, ElementId{std::string("GEN_2")}};
    const json idArray = toJsonArray(ids);
    if (idArray != json::parse("[7, \"GEN_2\"]") || !idArray[0].is_number_integer()) {
        std::cerr << "Mixed element ids serialized incorrectly: " << idArray.dump() << '\n';
        return 1;
    }

    if (toJsonArray(std::vector<std::string>{"a", "b"}) != json::parse("[\"a\", \"b\"]") ||
        !toJsonArray(std::vector<double>{}).is_array()) {
        std::cerr << "String or empty arrays serialized incorrectly\n";
        return 1;
    }

    DenseMatrix m(2, 3);
    for (std::size_t r = 0; r < 2; ++r) {
        for (std::size_t c = 0; c < 3; ++c) {
            m.at(r, c) = static_cast<double>(10 * r + c);
        }
    }
    m.at(1, 2) = nan;
    if (toJsonMatrix(m) != json::parse("[[0, 1, 2], [10, 11, null]]")) {
        std::cerr << "Matrix rows serialized incorrectly: " << toJsonMatrix(m).dump() << '\n';
        return 1;
    }
    const std::vector<double> column = extractColumn(m, 1);
    if (column.size() != 2 || column[0] != 1.0 || column[1] != 11.0) {
        std::cerr << "extractColumn returned the wrong column\n";
        return 1;
    }

    bool threw = false;
    try {
        (void)extractColumn(m, 3);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "extractColumn should reject an out-of-range column\n";
        return 1;
    }

    DenseMatrix broken(2, 2);
    broken.data.pop_back();
    threw = false;
    try {
        (void)toJsonMatrix(broken);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "toJsonMatrix should reject a data/shape mismatch\n";
        return 1;
    }

    const ComplexParts parts = splitComplex({{-0.5, 6.2}, {-0.5, -6.2}, {0.0, 0.0}});
    if (parts.real.size() != 3 || parts.imag.size() != 3 || parts.real[0] != -0.5 || parts.imag[1] != -6.2 ||
        parts.imag[2] != 0.0) {
        std::cerr << "splitComplex produced unexpected parts\n";
        return 1;
    }

    return 0;
}
