/* options.hpp – --key=value command line shared by the three drivers */
#pragma once
#include <string>

#include "model_iface.hpp"

namespace raydef {

struct Options {
    TrainOpt    train;
    std::string model_path = "models/defect_model.bin";

    /* service */
    std::string host    = "0.0.0.0";
    int         port    = 5000;
    int         threads = 8;

    bool        help    = false;
};

/*  Unknown flags are logged and ignored.  Throws InvalidInput for
    malformed numbers or out-of-range values.                          */
Options parse_options(int argc, char* argv[]);

std::string usage(const std::string& prog);

}  // namespace raydef
