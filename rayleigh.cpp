#include <cmath>
#include <string>

#include "rayleigh.hpp"
#include "errors.hpp"

namespace raydef {

namespace {

/* half away from zero */
inline double round2(double v) { return std::round(v * 100.0) / 100.0; }

}  // namespace

double rayleigh_pdf(double t, double sigma)
{
    if (!(sigma > 0.0)) throw InvalidDuration("rayleigh scale must be positive");
    const double s2 = sigma * sigma;
    return (t / s2) * std::exp(-(t * t) / (2.0 * s2));
}

MonthlyCurve distribute(long total, double duration)
{
    if (total < 0) throw InvalidInput("defect total cannot be negative");
    if (!std::isfinite(duration) || duration <= 0.0)
        throw InvalidDuration("duration must be a positive number of months");

    const double sigma   = duration * SIGMA_FACTOR;
    const double horizon = std::floor(duration * HORIZON_FACTOR);
    if (horizon > static_cast<double>(MAX_HORIZON))
        throw InvalidDuration("duration too long: horizon would exceed " +
                              std::to_string(MAX_HORIZON) + " months");

    MonthlyCurve out;
    const int h = static_cast<int>(horizon);
    if (h < 1) return out;

    out.distribution.reserve(h);
    out.months.reserve(h);
    for (int t = 1; t <= h; ++t) {
        out.distribution.push_back(round2(total * rayleigh_pdf(t, sigma)));
        out.months.push_back(t);
    }
    return out;
}

}  // namespace raydef
