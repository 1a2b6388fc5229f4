/**********************************************************************
 * defect_predictor.cpp
 *
 *   size ──► VolumeEstimator ──► K ──► distribute(K, duration) ──► forecast
 *
 * The estimator is loaded at most once per process unless reload() is
 * called explicitly; concurrent first requests queue on one mutex and
 * all but the first find the model already published.
 *********************************************************************/
#include <cmath>
#include <utility>

#include "defect_predictor.hpp"
#include "rayleigh.hpp"
#include "errors.hpp"

namespace raydef {

DefectPredictor::DefectPredictor(std::string model_path)
    : estimator_(std::move(model_path)) {}

bool DefectPredictor::load_once()
{
    if (state_.ready()) return true;

    std::lock_guard<std::mutex> lk(state_.mtx_);
    if (state_.ready()) return true;

    if (!estimator_.load()) return false;
    state_.publish(estimator_.model(), /*from_disk=*/true);
    return true;
}

std::shared_ptr<const FittedModel> DefectPredictor::ensure_ready()
{
    if (!load_once())
        throw ModelUnavailable("predictive model is not available; train one first "
                               "(expected at " + estimator_.model_path() + ")");
    return state_.snapshot();
}

DefectForecast DefectPredictor::predict(double size, double duration)
{
    /* cheap argument checks before any disk access */
    if (!std::isfinite(size)) throw InvalidInput("size must be a finite number");
    if (!std::isfinite(duration) || duration <= 0.0)
        throw InvalidDuration("duration must be a positive number of months");

    const std::shared_ptr<const FittedModel> m = ensure_ready();

    DefectForecast f;
    f.total_defects_estimated = VolumeEstimator::total_from(*m, size);

    MonthlyCurve curve = distribute(f.total_defects_estimated, duration);
    f.monthly_distribution = std::move(curve.distribution);
    f.projected_months     = std::move(curve.months);
    return f;
}

bool DefectPredictor::warm_up()
{
    return load_once();
}

bool DefectPredictor::reload()
{
    std::lock_guard<std::mutex> lk(state_.mtx_);
    if (!estimator_.load()) return false;
    state_.publish(estimator_.model(), /*from_disk=*/true);
    return true;
}

void DefectPredictor::install(const FittedModel& m)
{
    std::lock_guard<std::mutex> lk(state_.mtx_);
    state_.publish(std::make_shared<const FittedModel>(m), /*from_disk=*/false);
}

}  // namespace raydef
