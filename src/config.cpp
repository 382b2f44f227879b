#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace gaistream {

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"listen", "127.0.0.1:8080"},
            {"max_body", 1048576}
        }},
        {"sse", {
            {"heartbeat_interval_ms", 15000},
            {"flush_after_write", true},
            {"max_retries", 3},
            {"retry_hint_ms", 5000},
            {"buffer_size", 4096},
            {"include_id", false}
        }},
        {"ndjson", {
            {"buffer_size", 8192},
            {"flush_interval_ms", 100},
            {"compact_json", true},
            {"include_timestamp", false}
        }},
        {"stream", {
            {"queue_capacity", 100},
            {"provider", "echo"},
            {"model", "echo-1"}
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

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_integer() && obj[key].get<int64_t>() >= 0)
        out = obj[key].get<uint32_t>();
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean())
        out = obj[key].get<bool>();
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::load() {
    return load(expand_home("~/.gaistream/config.json"));
}

Config Config::load(const std::string& path) {
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
                } else {
                    std::cerr << "[config] Could not write migrated config: " << path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        read_string(s, "listen", cfg.server.listen);
        read_uint(s, "max_body", cfg.server.max_body);
    }

    if (j.contains("sse") && j["sse"].is_object()) {
        auto& s = j["sse"];
        read_uint(s, "heartbeat_interval_ms", cfg.sse.heartbeat_interval_ms);
        read_bool(s, "flush_after_write", cfg.sse.flush_after_write);
        read_uint(s, "max_retries", cfg.sse.max_retries);
        read_uint(s, "retry_hint_ms", cfg.sse.retry_hint_ms);
        read_uint(s, "buffer_size", cfg.sse.buffer_size);
        read_bool(s, "include_id", cfg.sse.include_id);
    }

    if (j.contains("ndjson") && j["ndjson"].is_object()) {
        auto& n = j["ndjson"];
        read_uint(n, "buffer_size", cfg.ndjson.buffer_size);
        read_uint(n, "flush_interval_ms", cfg.ndjson.flush_interval_ms);
        read_bool(n, "compact_json", cfg.ndjson.compact_json);
        read_bool(n, "include_timestamp", cfg.ndjson.include_timestamp);
    }

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        read_uint(s, "queue_capacity", cfg.stream.queue_capacity);
        read_string(s, "provider", cfg.stream.provider);
        read_string(s, "model", cfg.stream.model);
    }
    if (cfg.stream.queue_capacity == 0) cfg.stream.queue_capacity = 1;

    return cfg;
}

static bool env_uint(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v) return false;
    try {
        size_t used = 0;
        unsigned long parsed = std::stoul(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(v);
        out = static_cast<uint32_t>(parsed);
        return true;
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v << "\n";
        return false;
    }
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("GAISTREAM_LISTEN"))
        server.listen = v;
    env_uint("GAISTREAM_HEARTBEAT_MS", sse.heartbeat_interval_ms);
    env_uint("GAISTREAM_FLUSH_INTERVAL_MS", ndjson.flush_interval_ms);
}

SSEOptions Config::sse_options() const {
    SSEOptions opts;
    opts.heartbeat_interval = std::chrono::milliseconds(sse.heartbeat_interval_ms);
    opts.flush_after_write = sse.flush_after_write;
    opts.max_retries = static_cast<int>(sse.max_retries);
    opts.retry_hint_ms = sse.retry_hint_ms;
    opts.buffer_size = sse.buffer_size;
    opts.include_id = sse.include_id;
    return opts;
}

NDJSONOptions Config::ndjson_options() const {
    NDJSONOptions opts;
    opts.buffer_size = ndjson.buffer_size;
    opts.flush_interval = std::chrono::milliseconds(ndjson.flush_interval_ms);
    opts.compact_json = ndjson.compact_json;
    opts.include_timestamp = ndjson.include_timestamp;
    return opts;
}

} // namespace gaistream
