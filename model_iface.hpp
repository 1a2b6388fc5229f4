/* ──────────────────────────────────────────────────────────────
   model_iface.hpp     –  the abstraction layer
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

#include "common.hpp"
#include "linear_model.hpp"

namespace raydef {

struct TrainOpt {
    /* data source & split – the serving side ignores all of these */
    std::string data_path   = "data/datos_historicos.csv";
    std::string size_col    = "Tamano";
    std::string defects_col = "Total_Defectos";
    double      test_ratio  = 0.2;
    unsigned    seed        = 42;
};

struct IVolumeModel {
    virtual ~IVolumeModel() = default;

    /*  read the artifact from the configured location.
        false  → nothing there;  throws CorruptArtifact on bad bytes */
    virtual bool load() = 0;

    /*  least-squares fit; the result also becomes the resident model */
    virtual FittedModel fit(const std::vector<Sample>& samples) = 0;

    virtual void persist(const FittedModel& model,
                         const std::string& location) const = 0;

    /*  clamped, rounded total for one project                        */
    virtual long predict_total(double size) = 0;
};

}  // namespace raydef
