#include <algorithm>
#include <cmath>
#include <fstream>
#include <random>
#include <sstream>

#include "dataset.hpp"
#include "errors.hpp"

namespace raydef {

namespace {

/* split one CSV line; strips CR, surrounding blanks and double quotes */
std::vector<std::string> split_csv_line(std::string line)
{
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        tok = trim(tok);
        if (tok.size() >= 2 && tok.front() == '"' && tok.back() == '"')
            tok = trim(tok.substr(1, tok.size() - 2));
        out.push_back(tok);
    }
    if (!line.empty() && line.back() == ',') out.emplace_back();
    return out;
}

std::size_t column_index(const std::vector<std::string>& header,
                         const std::string& name,
                         const std::string& csv)
{
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end())
        throw DataError("column '" + name + "' not found in " + csv);
    return static_cast<std::size_t>(it - header.begin());
}

}  // namespace

HistoryTable load_history_csv(const std::string& csv,
                              const std::string& size_col,
                              const std::string& defects_col)
{
    if (!file_exists(csv) || is_directory(csv))
        throw DataError("data file not found: " + csv);
    std::ifstream fin(csv);
    if (!fin) throw DataError("cannot open " + csv);

    std::string line;
    if (!std::getline(fin, line)) throw DataError("empty data file: " + csv);

    std::vector<std::string> header = split_csv_line(line);
    /* UTF-8 BOM from spreadsheet exports */
    if (!header.empty() && header[0].compare(0, 3, "\xEF\xBB\xBF") == 0)
        header[0] = header[0].substr(3);

    const std::size_t ix = column_index(header, size_col,    csv);
    const std::size_t iy = column_index(header, defects_col, csv);

    HistoryTable tbl;
    std::size_t row = 0;
    while (std::getline(fin, line)) {
        if (trim(line).empty()) continue;
        ++row;

        std::vector<std::string> cells = split_csv_line(line);
        Sample s;
        s.row = row;
        if (ix >= cells.size() || iy >= cells.size() ||
            !parse_number(cells[ix], s.size) ||
            !parse_number(cells[iy], s.defects)) {
            ++tbl.skipped;
            continue;
        }
        tbl.samples.push_back(s);
    }
    return tbl;
}

void split_train_test(const std::vector<Sample>& all,
                      double               test_ratio,
                      std::uint32_t        seed,
                      std::vector<Sample>& train_out,
                      std::vector<Sample>& test_out)
{
    train_out.clear();
    test_out.clear();
    if (all.empty()) return;
    if (!(test_ratio > 0.0 && test_ratio < 1.0))
        throw InvalidInput("test ratio must be inside (0, 1)");

    std::vector<Sample> tmp = all;
    std::mt19937 rng(seed);
    std::shuffle(tmp.begin(), tmp.end(), rng);

    std::size_t n_test = std::max<std::size_t>(1, std::lround(tmp.size() * test_ratio));
    n_test = std::min(n_test, tmp.size());
    const std::size_t split = tmp.size() - n_test;

    train_out.assign(tmp.begin(),         tmp.begin() + split);
    test_out .assign(tmp.begin() + split, tmp.end());
}

}  // namespace raydef
