/* -----------------------------------------------------------
 *  api_server.cpp – REST front for the Rayleigh defect forecast
 *
 *    POST /predict   {"size": 50, "duration": 10}
 *    GET  /health
 *
 *  The model is loaded once at start-up when present; otherwise the
 *  server still comes up and /predict answers 503 until a model is
 *  trained (the first request after that picks it up).
 * ----------------------------------------------------------- */
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <httplib.h>

#include "common.hpp"
#include "defect_predictor.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "service.hpp"

using namespace raydef;

using Clock = std::chrono::steady_clock;

static void set_reply(httplib::Response& res, const HttpReply& r)
{
    res.status = r.status;
    res.set_content(r.body, "application/json");
}

static void log_request(const std::string& route, int status, Clock::time_point t0)
{
    const double ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    std::ostringstream os;
    os << route << " status=" << status << " latency_ms="
       << std::fixed << std::setprecision(3) << ms;
    if (status >= 500) logW(os.str()); else logI(os.str());
}

static int run(const Options& o)
{
    logI("starting defect prediction API");

    DefectPredictor predictor(o.model_path);
    try {
        if (predictor.warm_up()) {
            logI("model loaded from " + o.model_path);
        } else {
            logW("no trained model found at " + o.model_path);
            logW("run raydef_train before serving; predictions fail until then");
        }
    } catch (const CorruptArtifact& e) {
        logE(std::string("model artifact is unreadable: ") + e.what());
        logW("serving anyway; /predict answers 503 until the artifact is replaced");
    }

    Service svc(predictor);

    httplib::Server server;
    server.new_task_queue = [n = std::max(1, o.threads)] {
        return new httplib::ThreadPool(static_cast<std::size_t>(n));
    };

    /* any-origin CORS so the dashboard can call from another port */
    server.set_default_headers({
        {"Access-Control-Allow-Origin",  "*"},
        {"Access-Control-Allow-Headers", "Content-Type"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
    });
    server.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    server.Post("/predict", [&svc](const httplib::Request& req, httplib::Response& res) {
        const auto t0 = Clock::now();
        const HttpReply r = svc.handle_predict(req.body);
        set_reply(res, r);
        log_request("/predict", r.status, t0);
    });

    server.Get("/health", [&svc](const httplib::Request&, httplib::Response& res) {
        set_reply(res, svc.handle_health());
    });

    logI("listening on " + o.host + ":" + std::to_string(o.port) +
         " threads=" + std::to_string(o.threads));
    if (!server.listen(o.host.c_str(), o.port)) {
        logE("failed to bind " + o.host + ":" + std::to_string(o.port));
        return 1;
    }
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
