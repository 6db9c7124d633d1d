#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chatrelay {

nlohmann::json Config::defaults_json() {
    return {
        {"provider", {
            {"api_key", ""},
            {"base_url", "https://openrouter.ai/api/v1"},
            {"timeout", 120}
        }},
        {"stream", {
            {"idle_timeout", 300},
            {"sweep_interval", 30},
            {"max_connections", 5},
            {"connection_queue", 256},
            {"keepalive_interval", 15}
        }},
        {"server", {
            {"listen", "127.0.0.1:5000"},
            {"max_body", 262144},
            {"max_clients", 64}
        }},
        {"database", {
            {"path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("provider") && j["provider"].is_object()) {
        auto& p = j["provider"];
        read_string(p, "api_key", cfg.provider.api_key);
        read_string(p, "base_url", cfg.provider.base_url);
        read_u32(p, "timeout", cfg.provider.timeout);
        if (p.contains("temperature") && p["temperature"].is_number())
            cfg.provider.temperature = p["temperature"].get<double>();
    }

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        read_u32(s, "idle_timeout", cfg.stream.idle_timeout);
        read_u32(s, "sweep_interval", cfg.stream.sweep_interval);
        read_u32(s, "max_connections", cfg.stream.max_connections);
        read_u32(s, "connection_queue", cfg.stream.connection_queue);
        read_u32(s, "keepalive_interval", cfg.stream.keepalive_interval);
        if (cfg.stream.sweep_interval == 0) cfg.stream.sweep_interval = 1;
    }

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        read_string(s, "listen", cfg.server.listen);
        read_u32(s, "max_body", cfg.server.max_body);
        read_u32(s, "max_clients", cfg.server.max_clients);
    }

    if (j.contains("database") && j["database"].is_object()) {
        read_string(j["database"], "path", cfg.database.path);
    }

    return cfg;
}

static uint32_t env_u32(const char* value, uint32_t fallback) {
    try {
        long v = std::stol(value);
        if (v > 0) return static_cast<uint32_t>(v);
    } catch (const std::exception&) {
        // not a number; fall through to the warning
    }
    std::cerr << "[config] Ignoring invalid numeric value: " << value << "\n";
    return fallback;
}

void Config::apply_env() {
    if (const char* v = std::getenv("OPENROUTER_API_KEY"))
        provider.api_key = v;
    if (const char* v = std::getenv("OPENROUTER_BASE_URL"))
        provider.base_url = v;
    if (const char* v = std::getenv("OPENROUTER_TIMEOUT"))
        provider.timeout = env_u32(v, provider.timeout);
    if (const char* v = std::getenv("OPENROUTER_STREAM_TIMEOUT"))
        stream.idle_timeout = env_u32(v, stream.idle_timeout);
    if (const char* v = std::getenv("OPENROUTER_MAX_CONNECTIONS_PER_SESSION"))
        stream.max_connections = env_u32(v, stream.max_connections);
    if (const char* v = std::getenv("CHATRELAY_LISTEN"))
        server.listen = v;
    if (const char* v = std::getenv("CHATRELAY_DB_PATH"))
        database.path = v;
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.chatrelay/config.json"));
}

std::string Config::database_path() const {
    if (database.path.empty()) return expand_home("~/.chatrelay/app.db");
    return expand_home(database.path);
}

} // namespace chatrelay
