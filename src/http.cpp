#include <chrono>
#include <iostream>
#include <thread>

#include <curl/curl.h>

#include "http.hpp"

void Http::init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void Http::close() {
    curl_global_cleanup();
}

HttpResponse Http::get(const std::string& url, const HttpOptions& options) {
    HttpResponse response = fetch(url, options.timeoutSeconds);

    long delayMs = options.backoffMs;
    for (int attempt = 0; attempt < options.maxRetries && retryable(response); ++attempt) {
        std::cerr << "  [WARN] request failed (" << (response.error.empty() ? std::to_string(response.status) : response.error)
                  << "), retrying in " << delayMs << " ms" << std::endl;
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        delayMs *= 2;

        response = fetch(url, options.timeoutSeconds);
    }

    return response;
}

bool Http::retryable(const HttpResponse& response) {
    if (!response.error.empty()) {
        return true;
    }
    return response.status == 429 || response.status >= 500;
}

std::optional<std::string> Http::escape(const std::string& text) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "Error: curl_easy_init() failed, cannot encode '" << text << "'" << std::endl;
        return std::nullopt;
    }

    std::optional<std::string> result;
    char*                      out = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
    if (out) {
        result = std::string(out);
        curl_free(out);
    } else {
        std::cerr << "Error: cannot URL-encode '" << text << "'" << std::endl;
    }
    curl_easy_cleanup(curl);
    return result;
}

HttpResponse Http::fetch(const std::string& url, long timeoutSeconds) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init() failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "libfxetf/1.0");

    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    curl_easy_cleanup(curl);

    return response;
}

std::size_t Http::write(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}
