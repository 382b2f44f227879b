#pragma once
#include "ndjson_writer.hpp"
#include "sse_writer.hpp"
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace gaistream {

struct ServerConfig {
    std::string listen = "127.0.0.1:8080";
    uint32_t max_body = 1048576;
};

struct SSEConfig {
    uint32_t heartbeat_interval_ms = 15000;
    bool flush_after_write = true;
    uint32_t max_retries = 3;
    uint32_t retry_hint_ms = 5000;
    uint32_t buffer_size = 4096;
    bool include_id = false;
};

struct NDJSONConfig {
    uint32_t buffer_size = 8192;
    uint32_t flush_interval_ms = 100;
    bool compact_json = true;
    bool include_timestamp = false;
};

struct StreamSettings {
    uint32_t queue_capacity = 100;
    std::string provider = "echo";
    std::string model = "echo-1";
};

struct Config {
    ServerConfig server;
    SSEConfig sse;
    NDJSONConfig ndjson;
    StreamSettings stream;

    // Load from ~/.gaistream/config.json + env vars
    static Config load();

    // Load from `path` + env vars. A missing file is created with defaults,
    // missing keys are merged in and written back.
    static Config load(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Typed view of a config document; wrong-typed values keep the default.
    static Config from_json(const nlohmann::json& j);

    // GAISTREAM_LISTEN, GAISTREAM_HEARTBEAT_MS, GAISTREAM_FLUSH_INTERVAL_MS
    void apply_env();

    SSEOptions sse_options() const;
    NDJSONOptions ndjson_options() const;
};

} // namespace gaistream
