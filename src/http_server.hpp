#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <cstdint>

namespace agentbridge {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET", "POST", "DELETE", ...
    std::string path;     // URL-decoded later by the router, e.g. "/sessions/a%20b"
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
};

// Where a handler writes its answer: either one complete response, or a
// status line followed by chunks until the connection is closed.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual void send(int status, const std::string& content_type,
                      const std::string& body) = 0;

    // Headers for a body delimited by connection close
    virtual bool begin_stream(int status, const std::string& content_type) = 0;

    // Returns false once the peer has gone away
    virtual bool write(const std::string& chunk) = 0;
};

// Minimal HTTP/1.1 server, one thread per connection. Every response closes
// the connection. Runs its accept loop in a background thread.
class HttpServer {
public:
    using Handler = std::function<void(const HttpRequest&, ResponseWriter&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:5002"
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, then wait for in-flight connections to finish.
    void stop();

    // Port actually bound (useful with port 0)
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex active_mutex_;
    std::condition_variable active_cv_;
    size_t active_connections_ = 0;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range. Port 0 asks the kernel for one.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Access-Control-* header lines added to every response. origin and
// request_headers come from the request and may be empty.
std::string cors_headers(const std::string& origin, const std::string& request_headers);

// Percent-decoding; '+' becomes a space
std::string url_decode(const std::string& s);

} // namespace agentbridge
