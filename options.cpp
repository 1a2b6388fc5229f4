#include <cmath>
#include <sstream>

#include "options.hpp"
#include "errors.hpp"

namespace raydef {

namespace {

double to_double(const std::string& flag, const std::string& v)
{
    double d = 0;
    if (!parse_number(v, d)) throw InvalidInput(flag + " expects a number, got '" + v + "'");
    return d;
}

long to_long(const std::string& flag, const std::string& v)
{
    const double d = to_double(flag, v);
    if (std::fabs(d) > 1e15) throw InvalidInput(flag + " is out of range");
    if (d != static_cast<double>(static_cast<long>(d)))
        throw InvalidInput(flag + " expects an integer, got '" + v + "'");
    return static_cast<long>(d);
}

std::string need_value(const std::string& flag, const std::string& v)
{
    if (v.empty()) throw InvalidInput(flag + " needs a value");
    return v;
}

}  // namespace

Options parse_options(int argc, char* argv[])
{
    Options o;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if      (a == "--help" || a == "-h")          o.help = true;
        else if (a.rfind("--data=",0)==0)             o.train.data_path   = need_value("--data", a.substr(7));
        else if (a.rfind("--model_path=",0)==0)       o.model_path        = need_value("--model_path", a.substr(13));
        else if (a.rfind("--size_col=",0)==0)         o.train.size_col    = need_value("--size_col", a.substr(11));
        else if (a.rfind("--defects_col=",0)==0)      o.train.defects_col = need_value("--defects_col", a.substr(14));
        else if (a.rfind("--test_ratio=",0)==0)       o.train.test_ratio  = to_double("--test_ratio", a.substr(13));
        else if (a.rfind("--seed=",0)==0) {
            long s = to_long("--seed", a.substr(7));
            if (s < 0 || s > 0xFFFFFFFFL) throw InvalidInput("--seed must fit in 32 bits");
            o.train.seed = static_cast<unsigned>(s);
        }
        else if (a.rfind("--host=",0)==0)             o.host    = need_value("--host", a.substr(7));
        else if (a.rfind("--port=",0)==0)             o.port    = static_cast<int>(to_long("--port", a.substr(7)));
        else if (a.rfind("--threads=",0)==0)          o.threads = static_cast<int>(to_long("--threads", a.substr(10)));
        else                                          logW("ignored arg: " + a);
    }

    if (!(o.train.test_ratio > 0.0 && o.train.test_ratio < 1.0))
        throw InvalidInput("--test_ratio must be inside (0, 1)");
    if (o.port < 1 || o.port > 65535) throw InvalidInput("--port must be 1…65535");
    if (o.threads < 1)                throw InvalidInput("--threads must be >= 1");
    return o;
}

std::string usage(const std::string& prog)
{
    Options d;
    std::ostringstream os;
    os << "usage: " << prog << " [flags]\n"
       << "  --data=PATH          historical CSV          (" << d.train.data_path   << ")\n"
       << "  --size_col=NAME      project size column     (" << d.train.size_col    << ")\n"
       << "  --defects_col=NAME   total defects column    (" << d.train.defects_col << ")\n"
       << "  --model_path=PATH    model artifact          (" << d.model_path        << ")\n"
       << "  --test_ratio=R       hold-out fraction       (" << d.train.test_ratio  << ")\n"
       << "  --seed=N             shuffle seed            (" << d.train.seed        << ")\n"
       << "  --host=ADDR          bind address            (" << d.host              << ")\n"
       << "  --port=N             listen port             (" << d.port              << ")\n"
       << "  --threads=N          HTTP worker threads     (" << d.threads           << ")\n";
    return os.str();
}

}  // namespace raydef
