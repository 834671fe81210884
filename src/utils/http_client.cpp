#include "utils/http_client.hpp"
#include "common/errors.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace updown {

namespace {
    // CURL write callback
    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    std::once_flag g_curl_init;
}

CurlHttpClient::CurlHttpClient(long timeout_ms)
    : timeout_ms_(timeout_ms)
{
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

CurlHttpClient::~CurlHttpClient() = default;

std::string CurlHttpClient::get(const std::string& url, const HttpHeaders& headers) {
    return perform("GET", url, nullptr, headers);
}

std::string CurlHttpClient::post(const std::string& url, const std::string& body,
                                 const HttpHeaders& headers) {
    return perform("POST", url, &body, headers);
}

std::string CurlHttpClient::del(const std::string& url, const std::string& body,
                                const HttpHeaders& headers) {
    return perform("DELETE", url, &body, headers);
}

std::string CurlHttpClient::perform(const std::string& method, const std::string& url,
                                    const std::string* body, const HttpHeaders& headers) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw HttpError(0, "Failed to initialize CURL");
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (body) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Accept: application/json");
    if (body) {
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
    }
    for (const auto& [name, value] : headers) {
        header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw HttpError(0, std::string("CURL ") + method + " failed: " + curl_easy_strerror(res));
    }

    if (status < 200 || status >= 300) {
        spdlog::debug("HTTP {} {} -> {}: {}", method, url, status, response.substr(0, 200));
        throw HttpError(status, "HTTP " + std::to_string(status) + " from " + url, response);
    }

    return response;
}

} // namespace updown
