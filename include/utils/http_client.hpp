#pragma once

#include <string>
#include <vector>
#include <utility>

namespace updown {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * Blocking HTTP transport. Non-2xx statuses and transport failures throw HttpError.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual std::string get(const std::string& url, const HttpHeaders& headers = {}) = 0;
    virtual std::string post(const std::string& url, const std::string& body,
                             const HttpHeaders& headers = {}) = 0;
    virtual std::string del(const std::string& url, const std::string& body,
                            const HttpHeaders& headers = {}) = 0;
};

/**
 * libcurl implementation. One easy handle per request, safe to share across threads.
 */
class CurlHttpClient : public HttpTransport {
public:
    explicit CurlHttpClient(long timeout_ms = 10000);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    std::string get(const std::string& url, const HttpHeaders& headers = {}) override;
    std::string post(const std::string& url, const std::string& body,
                     const HttpHeaders& headers = {}) override;
    std::string del(const std::string& url, const std::string& body,
                    const HttpHeaders& headers = {}) override;

private:
    long timeout_ms_;

    std::string perform(const std::string& method, const std::string& url,
                        const std::string* body, const HttpHeaders& headers);
};

} // namespace updown
