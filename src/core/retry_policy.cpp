#include "retry_policy.hpp"
#include <cmath>

namespace webhunter {

std::chrono::milliseconds RetryPolicy::delay_after(int attempt) const {
    if (attempt < 1) {
        attempt = 1;
    }
    const double factor = std::pow(std::max(1.0, multiplier), attempt - 1);
    const double raw = static_cast<double>(base_delay.count()) * factor;
    const double cap = static_cast<double>(std::max(base_delay, max_delay).count());
    return std::chrono::milliseconds(static_cast<long long>(std::min(raw, cap)));
}

} // namespace webhunter
