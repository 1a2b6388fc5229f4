/* ──────────────────────────────────────────────────────────────
   volume_estimator.hpp  –  size → total defects, with its artifact
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "model_iface.hpp"

namespace raydef {

/*  Owns one FittedModel and the file it lives in.  Not thread-safe on
    its own; DefectPredictor serialises access for the serving path.   */
class VolumeEstimator : public IVolumeModel
{
public:
    explicit VolumeEstimator(std::string model_path);

    bool        load() override;
    FittedModel fit(const std::vector<Sample>& samples) override;
    void        persist(const FittedModel& model,
                        const std::string& location) const override;
    long        predict_total(double size) override;

    /* persist to the location this estimator loads from */
    void persist(const FittedModel& model) const { persist(model, model_path_); }

    bool is_loaded() const { return model_ != nullptr; }
    std::shared_ptr<const FittedModel> model() const { return model_; }
    const std::string& model_path() const { return model_path_; }

    /*  max(0, a·size + b) rounded half-to-even.  Shared with the
        predictor's lock-free path so both round the same way.        */
    static long total_from(const FittedModel& m, double size);

private:
    std::string                        model_path_;
    std::shared_ptr<const FittedModel> model_;
};

/* factory – what the training / QA drivers hold */
std::unique_ptr<IVolumeModel> make_linear(const std::string& model_path);

}  // namespace raydef
