#pragma once
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace agentbridge {

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 when no HTTP exchange completed
    std::string body;
    std::string error;    // transport failure, empty otherwise
};

// Outbound POST seam used by the chat history sink (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Never throws for transport failures; they come back as status 0
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;
};

// libcurl global state, held by main() for the life of the process
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct CurlOptions {
    long connect_timeout_seconds = 10;
    std::string user_agent = "agentbridge/0.1";
    // Checked about once a second; a set flag aborts the transfer
    const std::atomic<bool>* cancel = nullptr;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(CurlOptions options = CurlOptions());

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;

private:
    CurlOptions options_;
};

} // namespace agentbridge
