/* ──────────────────────────────────────────────────────────────
   service.hpp   –  JSON request handling, independent of the socket
                    layer so it can be driven straight from tests
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>

#include "common.hpp"
#include "defect_predictor.hpp"

namespace raydef {

constexpr const char* API_VERSION = "1.0";

struct HttpReply {
    int         status = 200;
    std::string body;
};

/* {"totalDefectsEstimated":K,"distribution":[…],"months":[…]} */
json forecast_to_json(const DefectForecast& f);

json error_body(const std::string& code, const std::string& message);

class Service
{
public:
    explicit Service(DefectPredictor& predictor) : predictor_(predictor) {}

    /*  POST /predict  body {"size": n, "duration": n}
        400 invalid_json | missing_fields | non_numeric_fields
            | invalid_duration | invalid_input
        503 model_unavailable        500 internal                     */
    HttpReply handle_predict(const std::string& body) const;

    /* GET /health */
    HttpReply handle_health() const;

private:
    DefectPredictor& predictor_;
};

}  // namespace raydef
