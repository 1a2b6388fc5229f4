/* dataset.hpp – historical project CSV → samples, hold-out split */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common.hpp"

namespace raydef {

struct HistoryTable {
    std::vector<Sample> samples;
    std::size_t         skipped = 0;   // rows with empty / non-numeric cells
};

/*  Header row names the columns; both named columns must be present.
    Throws DataError for a missing file or column.                     */
HistoryTable load_history_csv(const std::string& csv_path,
                              const std::string& size_col,
                              const std::string& defects_col);

/*  Shuffle with mt19937(seed) and cut max(1, round(n·ratio)) rows off
    the tail as the test split.                                        */
void split_train_test(const std::vector<Sample>& all,
                      double               test_ratio,
                      std::uint32_t        seed,
                      std::vector<Sample>& train_out,
                      std::vector<Sample>& test_out);

}  // namespace raydef
