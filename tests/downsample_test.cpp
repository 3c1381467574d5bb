#include "powersim/downsample.hpp"

#include <iostream>
#include <numeric>
#include <vector>

namespace {

std::vector<double> ramp(std::size_t n) {
    std::vector<double> values(n);
    std::iota(values.begin(), values.end(), 0.0);
    return values;
}

}  // namespace

int main() {
    using namespace powersim;

    // 1000 samples bounded to 100: every tenth sample survives.
    const DownsamplePlan plan = planDownsample(1000, 100);
    if (!plan.downsampled || plan.stride != 10 || plan.outputLength() != 100) {
        std::cerr << "Expected stride 10 and 100 output samples, got stride " << plan.stride << " and "
                  << plan.outputLength() << '\n';
        return 1;
    }
    const std::vector<double> reduced = applyDownsample(ramp(1000), plan);
    if (reduced.size() != 100) {
        std::cerr << "Downsampled length mismatch: " << reduced.size() << '\n';
        return 1;
    }
    for (std::size_t i = 0; i < reduced.size(); ++i) {
        if (reduced[i] != static_cast<double>(i * 10)) {
            std::cerr << "Sample " << i << " should come from index " << i * 10 << ", got " << reduced[i] << '\n';
            return 1;
        }
    }

    // Series already within the bound are returned unchanged.
    for (const std::size_t length : {std::size_t{0}, std::size_t{1}, std::size_t{50}, std::size_t{100}}) {
        const DownsamplePlan keep = planDownsample(length, 100);
        if (keep.downsampled || keep.stride != 1 || keep.outputLength() != length) {
            std::cerr << "Series of length " << length << " should not be downsampled\n";
            return 1;
        }
        if (applyDownsample(ramp(length), keep) != ramp(length)) {
            std::cerr << "Identity plan altered a series of length " << length << '\n';
            return 1;
        }
    }

    // A zero bound disables downsampling.
    const DownsamplePlan unbounded = planDownsample(1000000, 0);
    if (unbounded.downsampled || unbounded.outputLength() != 1000000) {
        std::cerr << "maxPoints == 0 must disable downsampling\n";
        return 1;
    }

    // Stride is floor(L / M): the output may exceed M but never 2M.
    const DownsamplePlan uneven = planDownsample(1050, 100);
    if (uneven.stride != 10 || uneven.outputLength() != 105) {
        std::cerr << "1050/100 should give stride 10 and 105 samples, got " << uneven.stride << " and "
                  << uneven.outputLength() << '\n';
        return 1;
    }
    const std::vector<double> unevenOut = applyDownsample(ramp(1050), uneven);
    if (unevenOut.size() != uneven.outputLength() || unevenOut.front() != 0.0 || unevenOut.back() != 1040.0) {
        std::cerr << "Uneven downsample produced unexpected samples\n";
        return 1;
    }

    // Just over the bound: stride collapses to 1 yet the series is flagged.
    const DownsamplePlan marginal = planDownsample(150, 100);
    if (!marginal.downsampled || marginal.stride != 1 || marginal.outputLength() != 150) {
        std::cerr << "150/100 should be flagged with stride 1\n";
        return 1;
    }

    // Reapplying the bound to an already bounded series is a no-op.
    const DownsamplePlan again = planDownsample(reduced.size(), 100);
    if (again.downsampled || applyDownsample(reduced, again) != reduced) {
        std::cerr << "Downsampling should be idempotent once within the bound\n";
        return 1;
    }

    return 0;
}
