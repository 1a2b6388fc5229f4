/* ──────────────────────────────────────────────────────────────
   defect_predictor.hpp  –  volume estimate + Rayleigh curve
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "volume_estimator.hpp"

namespace raydef {

struct DefectForecast {
    long                total_defects_estimated = 0;
    std::vector<double> monthly_distribution;
    std::vector<int>    projected_months;
};

/*  Process-wide handle to the resident model.
    Unready → ready happens once under mtx; readers after that only do
    an atomic load of an immutable FittedModel.  ready never goes back
    to false: a failed reload leaves the last good model in place.    */
class EstimatorState
{
public:
    bool ready() const { return ready_.load(std::memory_order_acquire); }

    std::shared_ptr<const FittedModel> snapshot() const {
        return std::atomic_load_explicit(&model_, std::memory_order_acquire);
    }

    /* successful artifact reads so far */
    std::size_t loads() const { return loads_.load(std::memory_order_relaxed); }

private:
    friend class DefectPredictor;

    void publish(std::shared_ptr<const FittedModel> m, bool from_disk) {
        std::atomic_store_explicit(&model_, std::move(m), std::memory_order_release);
        if (from_disk) loads_.fetch_add(1, std::memory_order_relaxed);
        ready_.store(true, std::memory_order_release);
    }

    std::mutex                          mtx_;
    std::shared_ptr<const FittedModel>  model_;
    std::atomic<bool>                   ready_{false};
    std::atomic<std::size_t>            loads_{0};
};

class DefectPredictor
{
public:
    explicit DefectPredictor(std::string model_path);

    DefectPredictor(const DefectPredictor&)            = delete;
    DefectPredictor& operator=(const DefectPredictor&) = delete;

    /*  Lazily loads on first call.  Throws ModelUnavailable when there
        is no artifact, CorruptArtifact when it cannot be decoded,
        InvalidInput / InvalidDuration for bad arguments.              */
    DefectForecast predict(double size, double duration);

    /* eager load for service start-up; false when nothing on disk */
    bool warm_up();

    /*  Re-read the artifact.  Missing → false, current model kept.
        Corrupt → current model kept, CorruptArtifact rethrown.       */
    bool reload();

    /* make a freshly fitted model resident without touching disk */
    void install(const FittedModel& m);

    bool ready() const { return state_.ready(); }
    std::size_t loads() const { return state_.loads(); }
    std::shared_ptr<const FittedModel> model() const { return state_.snapshot(); }
    const EstimatorState& state() const { return state_; }
    const std::string& model_path() const { return estimator_.model_path(); }

private:
    bool load_once();
    std::shared_ptr<const FittedModel> ensure_ready();

    VolumeEstimator estimator_;   // touched only under state_.mtx_
    EstimatorState  state_;
};

}  // namespace raydef
