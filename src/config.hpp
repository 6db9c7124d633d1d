#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace chatrelay {

struct ProviderConfig {
    std::string api_key;
    std::string base_url = "https://openrouter.ai/api/v1";
    uint32_t timeout = 120;              // seconds, connect + stream
    std::optional<double> temperature;   // omitted from requests when unset
};

struct StreamConfig {
    uint32_t idle_timeout = 300;         // seconds without chunks or viewers
    uint32_t sweep_interval = 30;        // seconds between idle sweeps
    uint32_t max_connections = 5;        // viewers per stream
    uint32_t connection_queue = 256;     // pending live events per viewer
    uint32_t keepalive_interval = 15;    // seconds between SSE keepalives
};

struct ServerConfig {
    std::string listen = "127.0.0.1:5000";
    uint32_t max_body = 262144;
    uint32_t max_clients = 64;
};

struct DatabaseConfig {
    std::string path;                    // empty = ~/.chatrelay/app.db
};

struct Config {
    ProviderConfig provider;
    StreamConfig stream;
    ServerConfig server;
    DatabaseConfig database;

    // Load from ~/.chatrelay/config.json + env vars
    static Config load();

    // Load from an explicit file path (created with defaults when missing)
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build a Config from already-merged JSON (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Apply environment variable overrides
    void apply_env();

    // Resolved database path (~ expanded)
    std::string database_path() const;
};

} // namespace chatrelay
