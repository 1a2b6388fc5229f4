/* metrics.hpp – goodness-of-fit numbers for the training / QA reports */
#pragma once
#include <vector>

namespace raydef {

/* coefficient of determination; zero-variance target → 1 if exact, else 0 */
double r2_score(const std::vector<double>& actual,
                const std::vector<double>& predicted);

double mean_absolute_error(const std::vector<double>& actual,
                           const std::vector<double>& predicted);

}  // namespace raydef
