#include "service.hpp"
#include "errors.hpp"

namespace raydef {

namespace {

HttpReply reply(int status, const json& j) { return HttpReply{status, j.dump()}; }

HttpReply fail(int status, const std::string& code, const std::string& msg)
{
    return reply(status, error_body(code, msg));
}

}  // namespace

json forecast_to_json(const DefectForecast& f)
{
    json j;
    j["totalDefectsEstimated"] = f.total_defects_estimated;
    j["distribution"]          = f.monthly_distribution;
    j["months"]                = f.projected_months;
    return j;
}

json error_body(const std::string& code, const std::string& message)
{
    return json{{"status", "error"}, {"code", code}, {"message", message}};
}

HttpReply Service::handle_predict(const std::string& body) const
{
    const json req = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (req.is_discarded() || !req.is_object())
        return fail(400, "invalid_json", "request body must be a JSON object");

    if (!req.contains("size") || !req.contains("duration"))
        return fail(400, "missing_fields",
                    "missing required fields: 'size' and 'duration' are both required");

    double size = 0, duration = 0;
    if (!parse_number(req.at("size"), size) || !parse_number(req.at("duration"), duration))
        return fail(400, "non_numeric_fields", "'size' and 'duration' must be numeric");

    try {
        const DefectForecast f = predictor_.predict(size, duration);
        json ok;
        ok["status"] = "success";
        ok["meta"]   = {{"model", "rayleigh"}, {"api_version", API_VERSION}};
        ok["data"]   = forecast_to_json(f);
        return reply(200, ok);
    } catch (const InvalidDuration& e) {
        return fail(400, "invalid_duration", e.what());
    } catch (const InvalidInput& e) {
        return fail(400, "invalid_input", e.what());
    } catch (const ModelNotReady& e) {
        return fail(503, "model_unavailable", e.what());
    } catch (const CorruptArtifact& e) {
        return fail(503, "model_unavailable",
                    std::string("model artifact is unreadable: ") + e.what());
    } catch (const std::exception& e) {
        return fail(500, "internal", std::string("internal server error: ") + e.what());
    }
}

HttpReply Service::handle_health() const
{
    return reply(200, json{{"status", "ok"}, {"model_ready", predictor_.ready()}});
}

}  // namespace raydef
