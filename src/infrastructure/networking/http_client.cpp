// EN: Implementation of the HttpClient class on top of the libcurl easy interface.
// FR : Implémentation de la classe HttpClient sur l'interface easy de libcurl.

#include "infrastructure/networking/http_client.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>

namespace CDP {

namespace {

// EN: Callback for writing response body.
// FR : Callback pour écrire le corps de la réponse.
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    const size_t total = size * nmemb;
    body->append(static_cast<const char*>(contents), total);
    return total;
}

// EN: Callback for parsing response headers.
// FR : Callback pour parser les headers de la réponse.
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(buffer, total);
    const auto pos = line.find(':');
    if (pos != std::string::npos) {
        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        key.erase(key.find_last_not_of(" \r\n") + 1);
        value.erase(0, value.find_first_not_of(" \r\n"));
        value.erase(value.find_last_not_of(" \r\n") + 1);
        (*headers)[key] = value;
    }
    return total;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

HttpClient::HttpClient(long connect_timeout_ms, long read_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms), read_timeout_ms_(read_timeout_ms) {
    ensureCurlInitialized();
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& extra_headers) const {
    return perform(url, extra_headers, false);
}

HttpResponse HttpClient::head(const std::string& url,
                              const std::map<std::string, std::string>& extra_headers) const {
    return perform(url, extra_headers, true);
}

HttpResponse HttpClient::perform(const std::string& url,
                                 const std::map<std::string, std::string>& extra_headers,
                                 bool no_body) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("CURL init failed");
    }

    HttpResponse resp;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, read_timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &resp.headers);
    if (no_body) {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    }

    curl_slist* raw_list = nullptr;
    for (const auto& [key, value] : extra_headers) {
        const std::string line = key + ": " + value;
        raw_list = curl_slist_append(raw_list, line.c_str());
    }
    CurlList header_list(raw_list);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    const auto start = std::chrono::steady_clock::now();
    const CURLcode res = curl_easy_perform(curl.get());
    const auto end = std::chrono::steady_clock::now();
    resp.elapsed_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());

    if (res != CURLE_OK) {
        throw std::runtime_error(error_buffer[0] ? std::string(error_buffer)
                                                 : std::string(curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

} // namespace CDP
