#include "http_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <memory>

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

HttpClient::HttpClient(int timeout_ms) : timeout_ms_(timeout_ms) {}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

HttpResponse HttpClient::perform(const std::string& url, const std::string* body,
                                 const std::vector<std::string>& headers) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw CollaboratorUnavailable("Failed to initialize CURL");
    }

    curl_slist* raw_list = nullptr;
    for (const auto& header : headers) {
        raw_list = curl_slist_append(raw_list, header.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);

    HttpResponse response{0, ""};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }
    if (body) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw CollaboratorUnavailable(std::string("Request failed: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("HTTP {} {}", response.status, url);
    return response;
}

HttpResponse HttpClient::get(const std::string& url, const std::vector<std::string>& headers) {
    return perform(url, nullptr, headers);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers) {
    return perform(url, &body, headers);
}

nlohmann::json HttpClient::get_json(const std::string& url, const std::vector<std::string>& headers) {
    auto response = get(url, headers);

    if (response.status == 429) {
        throw RateLimited("HTTP 429 from " + url);
    }
    if (response.status < 200 || response.status >= 300) {
        throw CollaboratorUnavailable("HTTP " + std::to_string(response.status) + " from " + url);
    }

    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        throw CollaboratorUnavailable(std::string("Malformed JSON: ") + e.what());
    }
}

std::string HttpClient::escape(const std::string& value) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return value;

    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.length()));
    if (!escaped) return value;
    std::string result(escaped);
    curl_free(escaped);
    return result;
}
