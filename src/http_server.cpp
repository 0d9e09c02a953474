#include "http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace agentbridge {

// ── URL helpers ───────────────────────────────────────────────────────────────

std::string url_decode(const std::string& s) {
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
    for (const auto& pair : split(qs, '&')) {
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else if (!pair.empty()) {
            result[url_decode(pair)] = "";
        }
    }
    return result;
}

std::string HttpRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5 ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    int p = std::stoi(digits);
    if (p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

// ── Socket writer ─────────────────────────────────────────────────────────────

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 500: return "Internal Server Error";
        default:  return "OK";
    }
}

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Any origin is allowed; a request Origin is echoed back for credentialed calls
std::string cors_headers(const std::string& origin, const std::string& request_headers) {
    std::string out;
    if (origin.empty()) {
        out += "Access-Control-Allow-Origin: *\r\n";
    } else {
        out += "Access-Control-Allow-Origin: " + origin + "\r\n"
               "Access-Control-Allow-Credentials: true\r\n"
               "Vary: Origin\r\n";
    }
    out += "Access-Control-Allow-Methods: GET, POST, PUT, PATCH, DELETE, OPTIONS\r\n";
    out += "Access-Control-Allow-Headers: " +
           (request_headers.empty() ? std::string("*") : request_headers) + "\r\n";
    return out;
}

class SocketResponseWriter : public ResponseWriter {
public:
    explicit SocketResponseWriter(int fd) : fd_(fd) {}

    void set_cors(const std::string& origin, const std::string& request_headers) {
        cors_ = cors_headers(origin, request_headers);
    }

    void send(int status, const std::string& content_type,
              const std::string& body) override {
        std::string resp =
            "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n";
        if (status != 204) {
            resp += "Content-Type: " + content_type + "\r\n"
                    "Content-Length: " + std::to_string(body.size()) + "\r\n";
        }
        resp += cors_ + "Connection: close\r\n\r\n";
        if (status != 204) resp += body;
        alive_ = send_all(fd_, resp);
    }

    bool begin_stream(int status, const std::string& content_type) override {
        std::string head =
            "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n"
            "Content-Type: " + content_type + "\r\n"
            "Cache-Control: no-cache\r\n" + cors_ +
            "Connection: close\r\n\r\n";
        alive_ = send_all(fd_, head);
        return alive_;
    }

    bool write(const std::string& chunk) override {
        if (!alive_) return false;
        alive_ = send_all(fd_, chunk);
        return alive_;
    }

private:
    int fd_;
    std::string cors_ = cors_headers("", "");
    bool alive_ = true;
};

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
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

    if (::pipe2(shutdown_pipe_, O_CLOEXEC) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [&](const std::string& msg) {
        error = msg;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); ::close(shutdown_pipe_[1]);
        shutdown_pipe_[0] = shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }

    if (::listen(server_fd_, 64) != 0) return fail("listen failed");

    socklen_t slen = sizeof(sa);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&sa), &slen) == 0) {
        bound_port_ = ntohs(sa.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t w = ::write(shutdown_pipe_[1], &b, 1);
        (void)w;
    }
    if (thread_.joinable()) thread_.join();
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }

    std::unique_lock<std::mutex> lock(active_mutex_);
    active_cv_.wait(lock, [this]() { return active_connections_ == 0; });
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept4(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen, SOCK_CLOEXEC);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv timeout
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            ++active_connections_;
        }
        std::thread([this, cfd]() {
            try {
                handle_connection(cfd);
            } catch (const std::exception& e) {
                std::cerr << "[gateway] Connection error: " << e.what() << "\n";
            }
            ::close(cfd);
            std::lock_guard<std::mutex> lock(active_mutex_);
            --active_connections_;
            active_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::handle_connection(int fd) const {
    SocketResponseWriter writer(fd);

    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            writer.send(400, "text/plain", "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    HttpRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) {
            writer.send(400, "text/plain", "Malformed request line");
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
    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    {
        auto origin = req.headers.find("origin");
        auto requested = req.headers.find("access-control-request-headers");
        writer.set_cors(origin != req.headers.end() ? origin->second : "",
                        requested != req.headers.end() ? requested->second : "");
    }

    // Read body when one is announced.
    size_t content_len = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        const std::string& value = it->second;
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos ||
            value.size() > 12) {
            writer.send(400, "text/plain", "Invalid Content-Length");
            return;
        }
        content_len = static_cast<size_t>(std::stoull(value));
    }

    if (content_len > max_body_) {
        writer.send(413, "text/plain", "Payload too large");
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) break;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    handler_(req, writer);
}

} // namespace agentbridge
