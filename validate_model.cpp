/* -----------------------------------------------------------
 *  validate_model.cpp – hold-out QA for the volume model
 *
 *  Hides test_ratio of the history, fits on the rest, and reports
 *  how far the blind predictions land from the real totals.  No
 *  artifact is written.
 * ----------------------------------------------------------- */
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>

#include "common.hpp"
#include "dataset.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "options.hpp"
#include "volume_estimator.hpp"

using namespace raydef;

static int run(const Options& o)
{
    logI("starting hold-out validation");

    if (!file_exists(o.train.data_path)) {
        logE("data file not found: " + o.train.data_path);
        return 1;
    }
    HistoryTable tbl = load_history_csv(o.train.data_path,
                                        o.train.size_col, o.train.defects_col);
    if (tbl.skipped)
        logW("skipped " + std::to_string(tbl.skipped) + " unusable rows");

    /* ---- split -------------------------------------------------- */
    std::vector<Sample> DS_tr, DS_te;
    split_train_test(tbl.samples, o.train.test_ratio, o.train.seed, DS_tr, DS_te);
    if (DS_tr.size() < 2)
        throw InsufficientData("only " + std::to_string(DS_tr.size()) +
                               " training rows left after the split");
    logI("split: " + std::to_string(DS_tr.size()) + " train / " +
         std::to_string(DS_te.size()) + " test");

    /* ---- fit on the training part only (no artifact) ------------ */
    std::unique_ptr<IVolumeModel> learner = make_linear(o.model_path);
    const FittedModel m = learner->fit(DS_tr);

    /* ---- blind prediction --------------------------------------- */
    std::vector<double> actual, predicted;
    actual.reserve(DS_te.size()); predicted.reserve(DS_te.size());

    std::cout << "\nVALIDATION REPORT\n"
              << std::setw(12) << "Size" << std::setw(16) << "Actual"
              << std::setw(16) << "Predicted" << std::setw(14) << "AbsDiff" << '\n';
    for (const Sample& s : DS_te) {
        const double yhat    = m.predict(s.size);
        const double rounded = std::round(yhat);
        actual.push_back(s.defects);
        predicted.push_back(yhat);
        std::cout << std::setw(12) << s.size
                  << std::setw(16) << s.defects
                  << std::setw(16) << static_cast<long>(rounded)
                  << std::setw(14) << static_cast<long>(std::fabs(s.defects - rounded))
                  << '\n';
    }

    /* ---- metrics ------------------------------------------------ */
    const double mae = mean_absolute_error(actual, predicted);
    const double r2  = r2_score(actual, predicted);
    std::cout << std::string(58, '-') << '\n'
              << std::fixed << std::setprecision(4)
              << "Mean absolute error (MAE): " << mae << " defects\n"
              << "Typical miss: +/- " << static_cast<long>(mae) << " defects\n"
              << "Test-set R^2             : " << r2 << '\n'
              << std::string(58, '-') << '\n';
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
