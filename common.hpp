/*───────────────────────────────────────────────────────────
 *  common.hpp   –  declarations-only
 *───────────────────────────────────────────────────────────*/
#pragma once

/* ---------- STL ---------- */
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/* ---------- 依赖库 ---------- */
#include <nlohmann/json.hpp>

namespace raydef {

using json = nlohmann::json;

/* ────────────────── 基础数据结构 ────────────────── */

/* one historical project: size → total defects */
struct Sample {
    double size    = 0;
    double defects = 0;
    std::size_t row = 0;        // 1-based data row in the source CSV
};


/* ────────────────── log & 文件工具 ────────────────── */
void logI(const std::string& msg);
void logW(const std::string& msg);
void logE(const std::string& msg);

bool        file_exists   (const std::string& path);
bool        is_directory  (const std::string& path);
std::string parent_dir    (const std::string& path);

/* mkdir -p; false if some component could not be created */
bool        make_dirs     (const std::string& path);

/* ────────────────── JSON / 数值小工具 ────────────────── */

/* number or numeric string → true + value; anything else → false */
bool parse_number(const json& v, double& out);
bool parse_number(const std::string& s, double& out);

std::string trim(const std::string& s);

/* FNV-1a 64 over raw bytes */
std::uint64_t fnv1a64(const void* data, std::size_t len,
                      std::uint64_t seed = 14695981039346656037ULL);

}  // namespace raydef
