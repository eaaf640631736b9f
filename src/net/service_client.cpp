#include "net/service_client.hpp"

#include <curl/curl.h>

#include <utility>

static size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

// Constructor
CurlGlobal::CurlGlobal() {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
}

// Destructor
CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

// Constructor
ServiceClient::ServiceClient(Config config) : config_(std::move(config)) {
    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("curl_easy_init failed");
}

// Destructor
ServiceClient::~ServiceClient() {
    if (curl_) curl_easy_cleanup(curl_);
}

std::string ServiceClient::withSiteId(const std::string& url) {
    char* escaped = curl_easy_escape(curl_, config_.siteId.c_str(), (int)config_.siteId.size());
    if (!escaped) throw ServiceError("cannot escape site id: " + config_.siteId);

    std::string out = url + (url.find('?') == std::string::npos ? "?" : "&") + "siteId=" + escaped;
    curl_free(escaped);
    return out;
}

nlohmann::json ServiceClient::post(const std::string& url, const char* data, size_t size, const char* contentType) {
    const std::string target = withSiteId(url);
    std::string body;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, (std::string("Content-Type: ") + contentType).c_str());
    headers = curl_slist_append(headers, "Accept: application/json");

    // The handle is reused across requests, like a keep-alive session
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, data);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)size);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, config_.timeoutSeconds);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body);

    const CURLcode rc = curl_easy_perform(curl_);
    curl_slist_free_all(headers);

    if (rc != CURLE_OK) {
        throw ServiceError("POST " + url + " failed: " + curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        throw ServiceError("POST " + url + " returned HTTP " + std::to_string(status) + ": " + body);
    }

    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ServiceError("POST " + url + " returned invalid JSON: " + e.what());
    }
}

std::string ServiceClient::speechToText(const std::vector<uint8_t>& wavBytes) {
    const nlohmann::json reply = post(config_.asrUrl, reinterpret_cast<const char*>(wavBytes.data()),
                                      wavBytes.size(), "audio/wav");

    if (!reply.is_object() || !reply.contains("text") || !reply["text"].is_string()) {
        throw ServiceError("speech-to-text reply has no \"text\" field: " + reply.dump());
    }
    return reply["text"].get<std::string>();
}

nlohmann::json ServiceClient::textToIntent(const std::string& text) {
    return post(config_.nluUrl, text.data(), text.size(), "text/plain");
}
