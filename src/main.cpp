#include "config.hpp"
#include "handler.hpp"
#include "provider.hpp"
#include "server.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: gaistream [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.gaistream/config.json)\n"
              << "  --listen HOST:PORT   Listen address (default: 127.0.0.1:8080)\n"
              << "  --provider NAME      Upstream provider (default: echo)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Endpoints:\n"
              << "  POST /v1/stream            gai.events.v1 stream (SSE or NDJSON by Accept)\n"
              << "  POST /v1/chat/completions  OpenAI-compatible chunk stream\n"
              << "  GET  /health               Liveness check\n"
              << "\n"
              << "Environment variables:\n"
              << "  GAISTREAM_LISTEN             Listen address override\n"
              << "  GAISTREAM_HEARTBEAT_MS       SSE keep-alive interval override\n"
              << "  GAISTREAM_FLUSH_INTERVAL_MS  NDJSON periodic flush override\n";
}

static void send_text(gaistream::ResponseWriter& out, int status,
                      const std::string& content_type, const std::string& body) {
    out.set_header("Content-Type", content_type);
    out.commit(status);
    out.write(body);
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string listen;
    std::string provider_name;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty() ? gaistream::Config::load()
                                      : gaistream::Config::load(config_path);

    // Override config with CLI args
    if (!listen.empty()) config.server.listen = listen;
    if (!provider_name.empty()) config.stream.provider = provider_name;

    std::unique_ptr<gaistream::StreamProvider> provider;
    try {
        provider = gaistream::create_provider(config.stream.provider);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto with_default_model = [&config](gaistream::PrepareFn prepare) {
        return [prepare, model = config.stream.model](const gaistream::HttpRequest& req) {
            auto prepared = prepare(req);
            if (prepared.request.model.empty()) prepared.request.model = model;
            return prepared;
        };
    };

    size_t capacity = config.stream.queue_capacity;
    gaistream::StreamHandler normalized(*provider,
                                        with_default_model(gaistream::prepare_generic_request),
                                        config.sse_options(), config.ndjson_options(), capacity);
    gaistream::StreamHandler openai(*provider,
                                    with_default_model(gaistream::prepare_openai_request),
                                    config.sse_options(), config.ndjson_options(), capacity);

    gaistream::StreamServer server(config.server.listen, config.server.max_body,
        [&](const gaistream::HttpRequest& req, gaistream::ResponseWriter& out,
            const gaistream::CancelToken& cancel) {
            if (req.method == "OPTIONS") {
                for (const auto& [name, value] : gaistream::streaming_headers("text/plain")) {
                    out.set_header(name, value);
                }
                out.commit(204);
                return;
            }
            if (req.path == "/health") {
                nlohmann::json health = {{"status", "ok"}, {"provider", provider->provider_name()}};
                send_text(out, 200, "application/json", health.dump());
                return;
            }

            gaistream::StreamHandler* handler = nullptr;
            if (req.path == "/v1/chat/completions") {
                handler = &openai;
            } else if (req.path == "/v1/stream" || req.path == "/v1/stream/sse" ||
                       req.path == "/v1/stream/ndjson") {
                handler = &normalized;
            }
            if (!handler) {
                out.send_error(404, "Not found");
                return;
            }
            if (req.method != "POST") {
                out.send_error(405, "Method not allowed");
                return;
            }
            handler->serve(req, out, cancel);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
