/**********************************************************************
 * linear_model.cpp
 *
 * Ordinary least squares for the one-feature volume model, plus the
 * on-disk encoding of its two coefficients.
 *
 *  artifact (CBOR map)
 *  ┌──────────────────────────────────────────────────────────────┐
 *  │ format    : "raydef.linear"                                  │
 *  │ version   : 1                                                │
 *  │ slope, intercept, r2 : float      n_samples : uint           │
 *  │ checksum  : hex FNV-1a 64 over the raw coefficient bytes     │
 *  └──────────────────────────────────────────────────────────────┘
 *********************************************************************/
#include <cmath>
#include <cstdio>

#include <Eigen/Dense>

#include "linear_model.hpp"
#include "metrics.hpp"
#include "errors.hpp"

namespace raydef {

namespace {

constexpr const char* kFormatTag = "raydef.linear";
constexpr int         kVersion   = 1;

std::string coef_checksum(double slope, double intercept)
{
    std::uint64_t h = fnv1a64(&slope, sizeof slope);
    h = fnv1a64(&intercept, sizeof intercept, h);
    char buf[17];
    std::snprintf(buf, sizeof buf, "%016llx", static_cast<unsigned long long>(h));
    return buf;
}

}  // namespace

/* ------------------------------------------------------------------ */
/* 1.  fit                                                            */
/* ------------------------------------------------------------------ */
FittedModel fit_ols(const std::vector<Sample>& samples)
{
    const Eigen::Index n = static_cast<Eigen::Index>(samples.size());
    if (n < 2)
        throw InsufficientData("need at least 2 samples to fit, got " +
                               std::to_string(n));

    Eigen::ArrayXd x(n), y(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Sample& s = samples[static_cast<std::size_t>(i)];
        if (!std::isfinite(s.size) || !std::isfinite(s.defects))
            throw InvalidInput("non-finite sample at row " + std::to_string(s.row));
        x(i) = s.size;
        y(i) = s.defects;
    }

    /* centred sums: exact on integer-valued lines */
    const double mx = x.mean();
    const double my = y.mean();
    const Eigen::ArrayXd dx = x - mx;
    const double sxx = (dx * dx).sum();
    if (sxx == 0.0)
        throw InsufficientData("all samples share the same size; slope is undefined");

    FittedModel m;
    m.slope     = (dx * (y - my)).sum() / sxx;
    m.intercept = my - m.slope * mx;
    m.n_samples = samples.size();

    const Eigen::ArrayXd yhat = m.slope * x + m.intercept;
    std::vector<double> act(y.data(), y.data() + n);
    std::vector<double> pred(yhat.data(), yhat.data() + n);
    m.r2 = r2_score(act, pred);
    return m;
}

/* ------------------------------------------------------------------ */
/* 2.  (de)serialise                                                  */
/* ------------------------------------------------------------------ */
std::vector<std::uint8_t> encode_model(const FittedModel& m)
{
    json j;
    j["format"]    = kFormatTag;
    j["version"]   = kVersion;
    j["slope"]     = m.slope;
    j["intercept"] = m.intercept;
    j["n_samples"] = m.n_samples;
    j["r2"]        = m.r2;
    j["checksum"]  = coef_checksum(m.slope, m.intercept);
    return json::to_cbor(j);
}

FittedModel decode_model(const std::vector<std::uint8_t>& bytes)
{
    if (bytes.empty()) throw CorruptArtifact("artifact is empty");

    json j;
    try {
        j = json::from_cbor(bytes);
    } catch (const json::exception& e) {
        throw CorruptArtifact(std::string("artifact is not valid CBOR: ") + e.what());
    }
    if (!j.is_object()) throw CorruptArtifact("artifact root is not a map");

    FittedModel m;
    try {
        const json& fmt = j.at("format");
        if (!fmt.is_string() || fmt.get<std::string>() != kFormatTag)
            throw CorruptArtifact("unknown artifact format");
        const json& ver = j.at("version");
        if (!ver.is_number_integer() || ver.get<int>() != kVersion)
            throw CorruptArtifact("unsupported artifact version " + ver.dump());

        for (const char* k : {"slope", "intercept", "r2"})
            if (!j.at(k).is_number())
                throw CorruptArtifact(std::string("field '") + k + "' is not a number");
        if (!j.at("n_samples").is_number_unsigned())
            throw CorruptArtifact("field 'n_samples' is not an unsigned integer");

        m.slope     = j.at("slope").get<double>();
        m.intercept = j.at("intercept").get<double>();
        m.r2        = j.at("r2").get<double>();
        m.n_samples = j.at("n_samples").get<std::size_t>();

        const json& sum = j.at("checksum");
        if (!sum.is_string()) throw CorruptArtifact("field 'checksum' is not a string");
        if (!std::isfinite(m.slope) || !std::isfinite(m.intercept))
            throw CorruptArtifact("non-finite coefficient");
        if (sum.get<std::string>() != coef_checksum(m.slope, m.intercept))
            throw CorruptArtifact("checksum mismatch");
    } catch (const json::exception& e) {
        throw CorruptArtifact(std::string("malformed artifact: ") + e.what());
    }
    return m;
}

}  // namespace raydef
