#include "powersim/downsample.hpp"

namespace powersim {

DownsamplePlan planDownsample(std::size_t length, std::size_t maxPoints) {
    DownsamplePlan plan{};
    plan.length = length;
    if (maxPoints == 0 || length <= maxPoints) {
        return plan;
    }
    plan.stride = length / maxPoints;
    plan.downsampled = true;
    return plan;
}

}  // namespace powersim
