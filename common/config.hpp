#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace optick {

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ingest_bridge settings. Credential comes from the environment, never argv.
struct BridgeConfig {
    std::string db_path = "resources/live_data.db";
    std::vector<std::string> instrument_files;
    std::vector<std::string> chain_files;
    std::string mode = "full";
    std::string authorize_url = "https://api.upstox.com/v3/feed/market-data-feed/authorize";
    std::string stream_url;              // set -> skip authorization
    std::string token_env = "A_TOKEN";
    bool insecure = false;               // skip TLS peer verification
    int ring_wait_ms = 20;
    int batch = 64;
    int flush_ms = 100;
    int busy_timeout_ms = 250;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

namespace detail {

inline int to_int(const std::string& flag, const std::string& v, int min_value) {
    char* end = nullptr;
    const long n = std::strtol(v.c_str(), &end, 10);
    if (v.empty() || *end != '\0' || n < min_value || n > 1'000'000'000L) {
        throw UsageError("invalid value for " + flag + ": '" + v + "'");
    }
    return static_cast<int>(n);
}

inline spdlog::level::level_enum to_level(const std::string& v) {
    const auto lvl = spdlog::level::from_str(v);
    // from_str maps unknown names to off
    if (lvl == spdlog::level::off && v != "off") {
        throw UsageError("unknown log level '" + v + "'");
    }
    return lvl;
}

} // namespace detail

inline BridgeConfig parse_bridge_args(const std::vector<std::string>& args) {
    BridgeConfig cfg;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw UsageError("missing value for " + flag);
            }
            return args[++i];
        };

        if (flag == "--db") cfg.db_path = value();
        else if (flag == "--instruments") cfg.instrument_files.push_back(value());
        else if (flag == "--chain") cfg.chain_files.push_back(value());
        else if (flag == "--mode") cfg.mode = value();
        else if (flag == "--authorize-url") cfg.authorize_url = value();
        else if (flag == "--stream-url") cfg.stream_url = value();
        else if (flag == "--token-env") cfg.token_env = value();
        else if (flag == "--insecure") cfg.insecure = true;
        else if (flag == "--ring-wait-ms") cfg.ring_wait_ms = detail::to_int(flag, value(), 0);
        else if (flag == "--batch") cfg.batch = detail::to_int(flag, value(), 1);
        else if (flag == "--flush-ms") cfg.flush_ms = detail::to_int(flag, value(), 1);
        else if (flag == "--busy-timeout-ms") cfg.busy_timeout_ms = detail::to_int(flag, value(), 0);
        else if (flag == "--log-level") cfg.log_level = detail::to_level(value());
        else throw UsageError("unknown option " + flag);
    }

    if (cfg.instrument_files.empty() && cfg.chain_files.empty()) {
        throw UsageError("at least one --instruments or --chain file is required");
    }
    if (cfg.mode != "full" && cfg.mode != "ltpc" && cfg.mode != "option_greeks" &&
        cfg.mode != "full_d30") {
        throw UsageError("unknown subscription mode '" + cfg.mode + "'");
    }
    return cfg;
}

} // namespace optick
