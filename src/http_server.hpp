#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace chatrelay {

// A parsed inbound HTTP request.
struct ServerRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // without query string
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;

    // Return a header value (name is matched lowercased), or "" if absent.
    std::string header(const std::string& name) const;
};

// Writes one chunked-encoding body piece at a time to the client socket.
class ChunkWriter {
public:
    ChunkWriter(int fd, const std::atomic<bool>& running);

    // False once the client is gone or a write failed.
    bool write(const std::string& data);

    // Server is shutting down; streaming handlers should return.
    bool stopping() const { return !running_.load(); }

    // Terminating zero-length chunk. Called by the server after the handler.
    void finish();

    bool failed() const { return failed_; }

private:
    int fd_;
    const std::atomic<bool>& running_;
    bool failed_ = false;
};

struct ServerResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    // When set, the response is sent with Transfer-Encoding: chunked and the
    // callback produces the body; `body` is ignored.
    std::function<void(ChunkWriter&)> stream;

    // Called instead of `stream` when the response head could not be sent.
    std::function<void()> on_abort;
};

// Small HTTP/1.1 server. One thread per accepted connection, up to
// max_clients at a time; further clients get 503. Every response closes
// the connection.
class HttpServer {
public:
    using Handler = std::function<ServerResponse(const ServerRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:5000"; port 0 picks a free port
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, uint32_t max_clients,
               Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, wait for in-flight connections to finish.
    void stop();

    bool running() const { return running_.load(); }

    // Bound port (useful when listening on port 0)
    uint16_t port() const { return port_; }

private:
    struct ClientThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void handle_connection(int client_fd) const;
    void reap_clients();

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    max_clients_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t port_         = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex clients_mutex_;
    std::vector<ClientThread> clients_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Reason phrase for a status code ("OK", "Not Found", ...)
const char* status_reason(int status);

} // namespace chatrelay
