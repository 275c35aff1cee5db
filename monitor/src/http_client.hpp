#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct HttpResponse {
    long status;
    std::string body;
};

// Thin libcurl wrapper. Every call creates its own easy handle so one
// client can be shared by the scheduler threads.
class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 10000);

    HttpResponse get(const std::string& url, const std::vector<std::string>& headers = {});
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<std::string>& headers = {});

    // GET and parse. Throws RateLimited on 429, CollaboratorUnavailable on
    // transport errors, non-2xx replies and malformed JSON.
    nlohmann::json get_json(const std::string& url, const std::vector<std::string>& headers = {});

    static std::string escape(const std::string& value);

private:
    int timeout_ms_;

    HttpResponse perform(const std::string& url, const std::string* body,
                         const std::vector<std::string>& headers);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
