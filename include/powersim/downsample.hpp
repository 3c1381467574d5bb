#pragma once

#include <cstddef>
#include <vector>

namespace powersim {

/**
 * @brief Stride chosen for a series of a given length.
 *
 * stride is 1 when no reduction is needed. Output index i maps back to the
 * original sample i * stride.
 */
struct DownsamplePlan {
    std::size_t length{0};
    std::size_t stride{1};
    bool downsampled{false};

    [[nodiscard]] std::size_t outputLength() const {
        return downsampled ? (length + stride - 1) / stride : length;
    }
};

// maxPoints == 0 disables downsampling.
DownsamplePlan planDownsample(std::size_t length, std::size_t maxPoints);

template <typename T>
std::vector<T> applyDownsample(const std::vector<T>& values, const DownsamplePlan& plan) {
    if (!plan.downsampled) {
        return values;
    }
    std::vector<T> out;
    out.reserve(plan.outputLength());
    for (std::size_t i = 0; i < values.size(); i += plan.stride) {
        out.push_back(values[i]);
    }
    return out;
}

}  // namespace powersim
