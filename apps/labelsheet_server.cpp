#include "server/server_options.h"
#include "server/server_context.h"
#include "server/http_utils.h"
#include "server/routes_health.h"
#include "server/routes_labels.h"

#include "labelsheet/logging.h"
#include "labelsheet/version.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <exception>
#include <string>

using namespace LabelSheet;

int main(int argc, char** argv) {
    ServerOptions opts;
    if (!ParseArgs(argc, argv, opts)) { return 1; }

    InitLogging(ParseLogLevel(opts.log_level));

    spdlog::info("LabelSheet Server v{}", LABELSHEET_VERSION_STRING);
    spdlog::info("Configuration: port={}, host={}, max_upload={}MB, log_level={}", opts.port,
                 opts.host, opts.max_upload_mb, opts.log_level);

    httplib::Server svr;
    svr.set_payload_max_length(static_cast<size_t>(opts.max_upload_mb) * 1024 * 1024);

    ServerContext ctx{svr, opts};

    RegisterHealthRoutes(ctx);
    RegisterLabelRoutes(ctx);

    // Error handler
    svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        AddCorsHeaders(req, res);
        json j = ErrorJson("Not found");
        if (res.status == 413) { j = ErrorJson("Payload too large"); }
        res.set_content(j.dump(), "application/json");
    });

    // Exception handler
    svr.set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            AddCorsHeaders(req, res);
            std::string msg = "Internal server error";
            try {
                if (ep) { std::rethrow_exception(ep); }
            } catch (const std::exception& e) { msg = e.what(); } catch (...) {
                msg = "Unknown exception";
            }
            spdlog::error("Unhandled exception: {}", msg);
            res.set_content(ErrorJson(msg).dump(), "application/json");
            res.status = 500;
        });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        if (req.path == "/api/health") { return; }
        auto elapsed = std::chrono::steady_clock::now() - req.start_time_;
        auto ms      = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        spdlog::info("{} {} {} {} {}ms", req.remote_addr, req.method, req.path, res.status, ms);
    });

    spdlog::info("Starting server on {}:{}", opts.host, opts.port);
    if (!svr.listen(opts.host, opts.port)) {
        spdlog::error("Failed to start server on {}:{}", opts.host, opts.port);
        return 1;
    }

    return 0;
}
