/* rayleigh.hpp – spread a defect total over project months */
#pragma once
#include <vector>

namespace raydef {

/* scale = duration · 0.4, horizon = ⌊duration · 1.5⌋ months */
constexpr double SIGMA_FACTOR   = 0.4;
constexpr double HORIZON_FACTOR = 1.5;
constexpr long   MAX_HORIZON    = 1200;   // 100 years

struct MonthlyCurve {
    std::vector<double> distribution;   // defects per month, 2 decimals
    std::vector<int>    months;         // 1 … horizon
};

/* p(t) = t/σ² · exp(−t² / 2σ²);  σ must be > 0 */
double rayleigh_pdf(double t, double sigma);

/*  total · p(t) for t = 1 … horizon.  Not renormalised: the tail past
    the horizon is simply dropped.  Throws InvalidDuration for
    duration ≤ 0, non-finite, or a horizon over MAX_HORIZON.          */
MonthlyCurve distribute(long total, double duration);

}  // namespace raydef
