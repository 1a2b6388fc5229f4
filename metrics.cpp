#include <Eigen/Dense>

#include "metrics.hpp"
#include "errors.hpp"

namespace raydef {

namespace {

void check_pair(const std::vector<double>& a, const std::vector<double>& p)
{
    if (a.empty())          throw InvalidInput("metric needs at least one value");
    if (a.size() != p.size()) throw InvalidInput("actual / predicted length mismatch");
}

Eigen::Map<const Eigen::ArrayXd> as_array(const std::vector<double>& v)
{
    return Eigen::Map<const Eigen::ArrayXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

}  // namespace

double r2_score(const std::vector<double>& actual,
                const std::vector<double>& predicted)
{
    check_pair(actual, predicted);
    const auto y    = as_array(actual);
    const auto yhat = as_array(predicted);

    const double ss_res = (y - yhat).square().sum();
    const double ss_tot = (y - y.mean()).square().sum();
    if (ss_tot == 0.0) return ss_res == 0.0 ? 1.0 : 0.0;
    return 1.0 - ss_res / ss_tot;
}

double mean_absolute_error(const std::vector<double>& actual,
                           const std::vector<double>& predicted)
{
    check_pair(actual, predicted);
    return (as_array(actual) - as_array(predicted)).abs().mean();
}

}  // namespace raydef
