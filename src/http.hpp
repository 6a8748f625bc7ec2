#pragma once
#include "clock.hpp"
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace modelgate {

// Shutdown hook: transfers poll this flag about once a second and give up
// with status 0 once it reads true. Pass nullptr to detach.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0: no response (connect failure, timeout, abort)
    std::string body;
};

// Transport seam for provider adapters, embedders and health checks.
// Implementations never throw for network trouble; they return status 0.
// Interpreting the status is the caller's job.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              Duration timeout) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             Duration timeout) = 0;
};

// Blocking HTTP/1.1 over POSIX sockets, TLS via OpenSSL for https URLs.
// The deadline covers DNS, connect, handshake and the full body read.
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      Duration timeout) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     Duration timeout) override;
};

} // namespace modelgate
