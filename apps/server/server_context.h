#pragma once

#include "server_options.h"

#include <httplib.h>

struct ServerContext {
    httplib::Server& server;
    const ServerOptions& options;
};
