/*───────────────────────────────────────────────────────────
 *  common.cpp   –  logging, file & number helpers
 *───────────────────────────────────────────────────────────*/
#include <cerrno>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sys/stat.h>   // stat / mkdir
#include <unistd.h>     // access

#include "common.hpp"

namespace raydef {

void logI(const std::string& s){ std::cerr<<"[INFO]  "<<s<<'\n'; }
void logW(const std::string& s){ std::cerr<<"[WARN]  "<<s<<'\n'; }
void logE(const std::string& s){ std::cerr<<"[ERR]   "<<s<<'\n'; }


/* ———— 简易文件/目录工具 ———— */
bool file_exists(const std::string& p){
    return ::access(p.c_str(), F_OK) == 0;
}
bool is_directory(const std::string& p){
    struct stat sb{};
    return ::stat(p.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}
std::string parent_dir(const std::string& p){
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos) return "";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}

bool make_dirs(const std::string& p){
    if (p.empty() || is_directory(p)) return true;
    std::string up = parent_dir(p);
    if (!up.empty() && up != p && !make_dirs(up)) return false;
    if (::mkdir(p.c_str(), 0755) != 0 && errno != EEXIST) return false;
    return is_directory(p);
}


/* ─────────────────────────────  utilities  ────────────────────────────── */
std::string trim(const std::string& s){
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e-1])) --e;
    return s.substr(b, e - b);
}

bool parse_number(const std::string& raw, double& out){
    std::string s = trim(raw);
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parse_number(const json& v, double& out){
    if (v.is_number()) {
        double d = v.get<double>();
        if (!std::isfinite(d)) return false;
        out = d;
        return true;
    }
    if (v.is_string()) return parse_number(v.get<std::string>(), out);
    return false;
}

std::uint64_t fnv1a64(const void* data, std::size_t len, std::uint64_t h){
    auto p = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= p[i];
        h *= 1099511628211ULL;
    }
    return h;
}

}  // namespace raydef
