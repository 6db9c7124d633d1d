#include "http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace chatrelay {

// ── URL helpers ───────────────────────────────────────────────────────────────

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

static std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    size_t start = 0;
    while (start <= qs.size()) {
        size_t amp = qs.find('&', start);
        if (amp == std::string::npos) amp = qs.size();
        std::string pair = qs.substr(start, amp - start);
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else if (!pair.empty()) {
            result[url_decode(pair)] = "";
        }
        start = amp + 1;
    }
    return result;
}

std::string ServerRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

std::string ServerRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5) return false;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
    }
    int p = std::stoi(digits);
    if (p < 0 || p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "OK";
}

// ── Socket helpers ────────────────────────────────────────────────────────────

static bool send_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

static void send_http_response(int fd, const ServerResponse& resp) {
    std::string out =
        "HTTP/1.1 " + std::to_string(resp.status) + " " + status_reason(resp.status) + "\r\n"
        "Content-Type: " + resp.content_type + "\r\n"
        "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
    for (const auto& h : resp.headers) {
        out += h.first + ": " + h.second + "\r\n";
    }
    out += "Connection: close\r\n\r\n" + resp.body;
    send_all(fd, out.c_str(), out.size());
}

static void send_simple(int fd, int status, const std::string& body) {
    ServerResponse resp;
    resp.status = status;
    resp.content_type = "text/plain";
    resp.body = body;
    send_http_response(fd, resp);
}

// ── ChunkWriter ───────────────────────────────────────────────────────────────

ChunkWriter::ChunkWriter(int fd, const std::atomic<bool>& running)
    : fd_(fd), running_(running) {}

bool ChunkWriter::write(const std::string& data) {
    if (failed_) return false;
    if (data.empty()) return true; // a zero-length chunk would end the body

    char size_line[32];
    int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", data.size());
    std::string frame(size_line, static_cast<size_t>(n));
    frame += data;
    frame += "\r\n";
    if (!send_all(fd_, frame.c_str(), frame.size())) failed_ = true;
    return !failed_;
}

void ChunkWriter::finish() {
    if (failed_) return;
    static const char kLastChunk[] = "0\r\n\r\n";
    if (!send_all(fd_, kLastChunk, sizeof(kLastChunk) - 1)) failed_ = true;
}

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body,
                       uint32_t max_clients, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , max_clients_(max_clients == 0 ? 1 : max_clients)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [&](const std::string& msg) {
        error = msg;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }

    if (::listen(server_fd_, 64) != 0) {
        return fail("listen failed");
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    std::cerr << "[server] Listening on " << host << ":" << port_ << "\n";
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t ignored = ::write(shutdown_pipe_[1], &b, 1);
        (void)ignored;
    }
    if (thread_.joinable()) thread_.join();

    std::vector<ClientThread> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.swap(clients_);
    }
    for (auto& c : clients) {
        if (c.thread.joinable()) c.thread.join();
    }

    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
    std::cerr << "[server] Stopped\n";
}

void HttpServer::reap_clients() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto it = clients_.begin();
    while (it != clients_.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        reap_clients();
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv/send timeout
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(cfd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        std::lock_guard<std::mutex> lock(clients_mutex_);
        if (clients_.size() >= max_clients_) {
            send_simple(cfd, 503, "Too many clients");
            ::close(cfd);
            continue;
        }
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([this, cfd, done]() {
            handle_connection(cfd);
            ::close(cfd);
            done->store(true);
        });
        clients_.push_back(ClientThread{std::move(t), done});
    }
}

void HttpServer::handle_connection(int fd) const {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_simple(fd, 400, "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    std::string request_line = headers_raw.substr(0, rl_end);

    ServerRequest req;
    {
        std::istringstream ss(request_line);
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) {
            send_simple(fd, 400, "Malformed request line");
            return;
        }
        auto q = pq.find('?');
        if (q != std::string::npos) {
            req.path         = pq.substr(0, q);
            req.query_params = parse_query_string(pq.substr(q + 1));
        } else {
            req.path = pq;
        }
    }

    // Parse headers.
    size_t pos = (rl_end == std::string::npos) ? headers_raw.size() : rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    // Read body when a length is given.
    size_t content_len = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        try {
            content_len = std::stoul(it->second);
        } catch (const std::exception&) {
            send_simple(fd, 400, "Invalid Content-Length");
            return;
        }
    }
    if (content_len > max_body_) {
        send_simple(fd, 413, "Payload too large");
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) break;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    ServerResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        std::cerr << "[server] Handler error for " << req.method << " " << req.path
                  << ": " << e.what() << "\n";
        send_simple(fd, 500, "Internal server error");
        return;
    }

    if (!resp.stream) {
        send_http_response(fd, resp);
        return;
    }

    std::string head =
        "HTTP/1.1 " + std::to_string(resp.status) + " " + status_reason(resp.status) + "\r\n"
        "Content-Type: " + resp.content_type + "\r\n"
        "Transfer-Encoding: chunked\r\n";
    for (const auto& h : resp.headers) {
        head += h.first + ": " + h.second + "\r\n";
    }
    head += "Connection: close\r\n\r\n";
    if (!send_all(fd, head.c_str(), head.size())) {
        if (resp.on_abort) resp.on_abort();
        return;
    }

    ChunkWriter writer(fd, running_);
    try {
        resp.stream(writer);
    } catch (const std::exception& e) {
        std::cerr << "[server] Stream error for " << req.path << ": " << e.what() << "\n";
    }
    writer.finish();
}

} // namespace chatrelay
