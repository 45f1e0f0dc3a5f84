#pragma once

#include "server_context.h"
#include "http_utils.h"
#include "labelsheet/version.h"

inline void RegisterHealthRoutes(ServerContext& ctx) {
    const int max_upload_mb = ctx.options.max_upload_mb;
    ctx.server.Get("/api/health",
                   [max_upload_mb](const httplib::Request& req, httplib::Response& res) {
                       AddCorsHeaders(req, res);
                       json j = {
                           {"status", "ok"},
                           {"version", LABELSHEET_VERSION_STRING},
                           {"max_upload_mb", max_upload_mb},
                       };
                       SetJsonResponse(res, j);
                   });
}
