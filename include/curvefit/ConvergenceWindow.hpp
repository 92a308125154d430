#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>

namespace curvefit {

/*  Last ten |Δχ²|; NaN marks a slot that has not been filled yet and keeps
 *  the window from reporting convergence.                                   */
class ConvergenceWindow {
public:
    static constexpr std::size_t kSize = 10;

    ConvergenceWindow() { slots_.fill(std::numeric_limits<double>::quiet_NaN()); }

    void push(double delta)
    {
        std::rotate(slots_.begin(), slots_.begin() + 1, slots_.end());
        slots_.back() = delta;
    }

    /*  true only when every slot holds a delta <= epsilon                  */
    bool converged(double epsilon) const
    {
        double worst = 0.0;
        for (double d : slots_) {
            if (std::isnan(d)) return false;
            worst = std::max(worst, d);
        }
        return worst <= epsilon;
    }

private:
    std::array<double, kSize> slots_;
};

} // namespace curvefit
