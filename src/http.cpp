#include "http.hpp"

#include <curl/curl.h>
#include <memory>

namespace agentbridge {

CurlGlobal::CurlGlobal() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

namespace {

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(data, size * nmemb);
    return size * nmemb;
}

int check_cancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const std::atomic<bool>*>(clientp);
    return cancel->load(std::memory_order_relaxed) ? 1 : 0;
}

} // namespace

CurlHttpClient::CurlHttpClient(CurlOptions options)
    : options_(std::move(options))
{}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    HttpResponse response;

    EasyHandle easy(curl_easy_init(), &curl_easy_cleanup);
    if (!easy) {
        response.error = "curl_easy_init failed";
        return response;
    }

    HeaderList list(nullptr, &curl_slist_free_all);
    for (const auto& [name, value] : headers) {
        curl_slist* grown = curl_slist_append(list.get(), (name + ": " + value).c_str());
        if (!grown) {
            response.error = "Out of memory building headers";
            return response;
        }
        list.release();
        list.reset(grown);
    }

    CURL* h = easy.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, list.get());
    curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, timeout_seconds);
    // Gateway threads post concurrently; signals are not safe across them
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    if (options_.cancel) {
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, check_cancel);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA,
                         const_cast<std::atomic<bool>*>(options_.cancel));
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        response.error = curl_easy_strerror(rc);
        response.body.clear();
        return response;
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace agentbridge
