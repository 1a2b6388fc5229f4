/**********************************************************************
 * volume_estimator.cpp
 *
 *  load    : artifact → memory (false when absent, throws when bad)
 *  fit     : OLS over (size, defects) → resident model
 *  persist : memory → artifact, via <path>.tmp + rename
 *  predict : clamped / rounded total, lazily loading on first use
 *********************************************************************/
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

#include "volume_estimator.hpp"
#include "errors.hpp"

namespace raydef {

VolumeEstimator::VolumeEstimator(std::string model_path)
    : model_path_(std::move(model_path)) {}

/* ------------ load ------------------------------------------- */
bool VolumeEstimator::load()
{
    if (!file_exists(model_path_)) return false;
    if (is_directory(model_path_))
        throw CorruptArtifact("artifact path is a directory: " + model_path_);

    std::ifstream in(model_path_, std::ios::binary);
    if (!in) throw CorruptArtifact("cannot open artifact " + model_path_);
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad()) throw CorruptArtifact("read error on " + model_path_);

    FittedModel m = decode_model(bytes);
    model_ = std::make_shared<const FittedModel>(m);
    return true;
}

/* ------------ fit -------------------------------------------- */
FittedModel VolumeEstimator::fit(const std::vector<Sample>& samples)
{
    FittedModel m = fit_ols(samples);
    model_ = std::make_shared<const FittedModel>(m);
    return m;
}

/* ------------ persist ---------------------------------------- */
void VolumeEstimator::persist(const FittedModel& model,
                              const std::string& location) const
{
    const std::string dir = parent_dir(location);
    if (!dir.empty() && !make_dirs(dir))
        throw Error("cannot create model directory " + dir);

    const std::vector<std::uint8_t> bytes = encode_model(model);
    const std::string tmp = location + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw Error("cannot write " + tmp);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) throw Error("short write on " + tmp);
    }
    if (std::rename(tmp.c_str(), location.c_str()) != 0) {
        std::remove(tmp.c_str());
        throw Error("cannot move artifact into place at " + location);
    }
}

/* ------------ predict ---------------------------------------- */
long VolumeEstimator::predict_total(double size)
{
    if (!model_ && !load())
        throw ModelNotReady("no fitted model in memory and none at " + model_path_);
    return total_from(*model_, size);
}

long VolumeEstimator::total_from(const FittedModel& m, double size)
{
    if (!std::isfinite(size)) throw InvalidInput("size must be a finite number");

    const double raw = m.predict(size);
    if (!std::isfinite(raw)) throw InvalidInput("size is out of range for the model");
    if (raw <= 0.0) return 0;
    if (raw >= static_cast<double>(std::numeric_limits<long>::max()))
        throw InvalidInput("predicted total overflows");

    /* default FP environment rounds to nearest, ties to even */
    return static_cast<long>(std::nearbyint(raw));
}

std::unique_ptr<IVolumeModel> make_linear(const std::string& model_path)
{
    return std::unique_ptr<IVolumeModel>(new VolumeEstimator(model_path));
}

}  // namespace raydef
