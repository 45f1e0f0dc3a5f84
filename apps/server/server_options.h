#pragma once

#include <cstdio>
#include <cstdlib>
#include <string>

struct ServerOptions {
    int port              = 8080;
    std::string host      = "0.0.0.0";
    int max_upload_mb     = 10;
    std::string log_level = "info";
};

inline void PrintUsage(const char* exe) {
    std::printf(
        "Usage: %s [options]\n"
        "Options:\n"
        "  --port PORT          HTTP port (default: 8080)\n"
        "  --host HOST          Bind address (default: 0.0.0.0)\n"
        "  --max-upload-mb N    Max upload size in MB (default: 10)\n"
        "  --log-level LEVEL    Log level: trace/debug/info/warn/error/off (default: info)\n",
        exe);
}

inline bool ParseArgs(int argc, char** argv, ServerOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--port") && i + 1 < argc) {
            opts.port = std::atoi(argv[++i]);
        } else if ((arg == "--host") && i + 1 < argc) {
            opts.host = argv[++i];
        } else if ((arg == "--max-upload-mb") && i + 1 < argc) {
            opts.max_upload_mb = std::atoi(argv[++i]);
        } else if ((arg == "--log-level") && i + 1 < argc) {
            opts.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return false;
        } else {
            std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            PrintUsage(argv[0]);
            return false;
        }
    }
    if (opts.port <= 0 || opts.port > 65535) {
        std::fprintf(stderr, "Error: --port must be in 1..65535\n");
        return false;
    }
    if (opts.max_upload_mb <= 0) {
        std::fprintf(stderr, "Error: --max-upload-mb must be positive\n");
        return false;
    }
    return true;
}
