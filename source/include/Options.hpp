#pragma once

#include "Log.hpp"
#include "Errors.hpp"
#include "ServerConfig.hpp"

#include <chrono>
#include <string>
#include <optional>

struct MonitorOptions {
    std::string config_path = "model_servers.yaml";
    bool console = false;

    std::chrono::seconds delay{ 0 };
    std::chrono::milliseconds timeout{ 30000 };
    std::chrono::milliseconds refresh{ 250 };

    ServerFilter filter;

    LogLevel log_level = LogLevel::Info;
    std::optional<std::string> log_file;
};

// nullopt when --help was asked for (the usage text has been printed), UsageError on bad input
std::optional<MonitorOptions> parse_options(int argc, const char* const argv[]);

std::string usage_text();
