#ifndef SERVICE_CLIENT_HPP
#define SERVICE_CLIENT_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

typedef void CURL;

class ServiceError : public std::runtime_error {
public:
    explicit ServiceError(const std::string& what) : std::runtime_error(what) {}
};

// curl_global_init / curl_global_cleanup for the lifetime of the object
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Speech-to-text and text-to-intent HTTP endpoints.
// All calls throw ServiceError on transport errors, HTTP status >= 400 or bad JSON.
class ServiceClient {
public:
    struct Config {
        std::string siteId = "default";
        std::string asrUrl = "http://localhost:12101/api/speech-to-text";
        std::string nluUrl = "http://localhost:12101/api/text-to-intent";
        long timeoutSeconds = 10;
    };

    explicit ServiceClient(Config config);
    ~ServiceClient();

    ServiceClient(const ServiceClient&) = delete;
    ServiceClient& operator=(const ServiceClient&) = delete;

    // POSTs a WAV file, returns the "text" field of the reply
    std::string speechToText(const std::vector<uint8_t>& wavBytes);

    // POSTs plain text, returns the intent JSON
    nlohmann::json textToIntent(const std::string& text);

private:
    nlohmann::json post(const std::string& url, const char* data, size_t size, const char* contentType);
    std::string withSiteId(const std::string& url);

    Config config_;
    CURL* curl_ = nullptr;
};

#endif
