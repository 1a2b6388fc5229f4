/* ──────────────────────────────────────────────────────────────
   linear_model.hpp   –  single-feature OLS  (defects ≈ a·size + b)
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common.hpp"

namespace raydef {

/* immutable once built; the only thing that ever hits disk */
struct FittedModel {
    double      slope     = 0;
    double      intercept = 0;
    std::size_t n_samples = 0;
    double      r2        = 0;   // in-sample coefficient of determination

    /* raw a·size + b, no clamping */
    double predict(double size) const { return slope * size + intercept; }

    bool operator==(const FittedModel& o) const {
        return slope == o.slope && intercept == o.intercept &&
               n_samples == o.n_samples && r2 == o.r2;
    }
    bool operator!=(const FittedModel& o) const { return !(*this == o); }
};

/* closed-form least squares; throws InsufficientData / InvalidInput */
FittedModel fit_ols(const std::vector<Sample>& samples);

/* ---------- artifact encoding (CBOR, checksummed) ---------- */
std::vector<std::uint8_t> encode_model(const FittedModel& m);

/* throws CorruptArtifact */
FittedModel decode_model(const std::vector<std::uint8_t>& bytes);

}  // namespace raydef
