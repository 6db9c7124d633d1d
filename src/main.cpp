#include "api.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "http.hpp"
#include "http_server.hpp"
#include "provider.hpp"
#include "store/sqlite_chat_store.hpp"
#include "stream_service.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: chatrelay [options]\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Address to listen on (default: 127.0.0.1:5000)\n"
              << "  --db PATH            Chat database (default: ~/.chatrelay/app.db)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Endpoints (under /api/v1/messages/chat-sessions/{id}):\n"
              << "  POST send-message    Stream a reply as server-sent events\n"
              << "  POST cancel-message  Cancel the reply in progress\n"
              << "  GET  stream          Reattach to the reply in progress\n"
              << "  GET  stream-status   Describe the reply in progress\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENROUTER_API_KEY                      API key for OpenRouter\n"
              << "  OPENROUTER_BASE_URL                     Override the API base URL\n"
              << "  OPENROUTER_TIMEOUT                      Upstream timeout in seconds\n"
              << "  OPENROUTER_STREAM_TIMEOUT               Idle stream timeout in seconds\n"
              << "  OPENROUTER_MAX_CONNECTIONS_PER_SESSION  Viewers per stream\n"
              << "  CHATRELAY_LISTEN                        Listen address\n"
              << "  CHATRELAY_DB_PATH                       Chat database path\n";
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string listen_addr;
    std::string db_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen_addr = argv[++i];
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    chatrelay::http_init();
    auto config = chatrelay::Config::load();

    // Override config with CLI args
    if (!listen_addr.empty()) {
        config.server.listen = listen_addr;
    }
    if (!db_path.empty()) {
        config.database.path = db_path;
    }

    if (config.provider.api_key.empty()) {
        std::cerr << "Warning: no OpenRouter API key configured; "
                  << "send-message will return 503.\n";
    }

    chatrelay::PlatformHttpClient http_client;
    auto provider = chatrelay::create_provider(config.provider, http_client);
    chatrelay::SqliteChatStore store(config.database_path());

    chatrelay::StreamService service(store, store, store, *provider, config.stream,
                                     config.provider.temperature);
    chatrelay::IdleSupervisor supervisor(
        service.cancellation(),
        std::chrono::seconds(config.stream.idle_timeout),
        std::chrono::seconds(config.stream.sweep_interval));

    chatrelay::Api api(service, std::chrono::seconds(config.stream.keepalive_interval));
    chatrelay::HttpServer server(
        config.server.listen, config.server.max_body, config.server.max_clients,
        [&api](const chatrelay::ServerRequest& req) { return api.handle(req); });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        chatrelay::http_cleanup();
        return 1;
    }
    supervisor.start();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif

    std::cout << "ChatRelay listening on " << config.server.listen
              << " (database " << store.path() << ")\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[main] Shutting down\n";
    supervisor.stop();
    service.shutdown();   // viewers get the error event before sockets close
    server.stop();

    chatrelay::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
