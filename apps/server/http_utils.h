#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

using json = nlohmann::json;

inline json ErrorJson(const std::string& message) { return json{{"error", message}}; }

inline void SetJsonResponse(httplib::Response& res, const json& j, int status = 200) {
    res.set_content(j.dump(), "application/json");
    res.status = status;
}

inline void SetBinaryResponse(httplib::Response& res, const std::vector<uint8_t>& data,
                              const std::string& content_type, const std::string& filename = "") {
    res.set_content(std::string(reinterpret_cast<const char*>(data.data()), data.size()),
                    content_type);
    if (!filename.empty()) {
        res.set_header("Content-Disposition", "attachment; filename=\"" + filename + "\"");
    }
    res.status = 200;
}

inline void AddCorsHeaders(const httplib::Request& req, httplib::Response& res) {
    std::string origin = req.has_header("Origin") ? req.get_header_value("Origin") : "";
    if (!origin.empty()) {
        res.set_header("Access-Control-Allow-Origin", origin);
    } else {
        res.set_header("Access-Control-Allow-Origin", "*");
    }
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.set_header("Access-Control-Max-Age", "86400");
}
