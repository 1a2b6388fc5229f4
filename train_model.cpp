/* -----------------------------------------------------------
 *  train_model.cpp – fit size → defects and write the artifact
 *
 *    raydef_train --data=data/datos_historicos.csv \
 *                 --model_path=models/defect_model.bin
 * ----------------------------------------------------------- */
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include "common.hpp"
#include "dataset.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "volume_estimator.hpp"

using namespace raydef;

static int run(const Options& o)
{
    logI("starting model training");

    /* ========== 1. data ===================================== */
    if (!file_exists(o.train.data_path)) {
        logE("data file not found: " + o.train.data_path);
        logE("check that the CSV exists before training");
        return 1;
    }
    HistoryTable tbl = load_history_csv(o.train.data_path,
                                        o.train.size_col, o.train.defects_col);
    logI("loaded " + std::to_string(tbl.samples.size()) + " records from " +
         o.train.data_path);
    if (tbl.skipped)
        logW("skipped " + std::to_string(tbl.skipped) + " rows with missing or "
             "non-numeric '" + o.train.size_col + "' / '" + o.train.defects_col + "'");

    /* ========== 2. fit ====================================== */
    std::unique_ptr<IVolumeModel> learner = make_linear(o.model_path);
    const FittedModel m = learner->fit(tbl.samples);

    /* ========== 3. persist ================================== */
    const std::string dir = parent_dir(o.model_path);
    const bool fresh_dir  = !dir.empty() && !is_directory(dir);
    learner->persist(m, o.model_path);
    if (fresh_dir) logI("created directory " + dir);

    /* ========== 4. report =================================== */
    std::ostringstream os;
    os << std::fixed << std::setprecision(4) << m.r2;
    logI("model trained and saved to " + o.model_path);
    std::cout << "defects = " << m.slope << " * size + " << m.intercept << '\n'
              << "Model quality (R^2 score): " << os.str() << '\n';
    return 0;
}

int main(int argc, char* argv[])
{
    try {
        Options o = parse_options(argc, argv);
        if (o.help) { std::cout << usage(argv[0]); return 0; }
        return run(o);
    } catch (const raydef::Error& e) {
        logE(e.what());
        return 1;
    }
}
