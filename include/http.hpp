#pragma once

#include <cstddef>
#include <optional>
#include <string>

struct HttpOptions {
    /**
     * @brief Whole-request timeout in seconds (CURLOPT_TIMEOUT).
     */
    long timeoutSeconds = 10;

    /**
     * @brief Extra attempts after the first one on transport errors, 429 and 5xx.
     */
    int maxRetries = 3;

    /**
     * @brief Base delay before the first retry. Doubles on every retry.
     */
    long backoffMs = 500;
};

struct HttpResponse {
    /**
     * @brief HTTP status code, 0 when no response was received.
     */
    long status = 0;

    std::string body = "";

    /**
     * @brief Transport error message (curl_easy_strerror), empty on success.
     */
    std::string error = "";

    [[nodiscard]] bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

class Http {
   public:
    static void init();
    static void close();

    Http()  = delete;
    ~Http() = delete;

    Http(const Http& other) = delete;
    Http(Http&& other)      = delete;

    Http& operator=(const Http& other) = delete;
    Http& operator=(Http&& other) = delete;

    /**
     * @brief Perform a GET request with timeout and bounded retries.
     * @param url     Absolute URL including the query string.
     * @param options Timeout and retry policy.
     * @return HttpResponse of the last attempt.
     */
    [[nodiscard]] static HttpResponse get(const std::string& url, const HttpOptions& options = {});

    /**
     * @brief URL-encode a path segment or query value (e.g., "Korea, Republic of").
     * @return Encoded text, or std::nullopt when curl cannot encode it.
     */
    [[nodiscard]] static std::optional<std::string> escape(const std::string& text);

    /**
     * @brief Whether a response warrants another attempt (transport error, 429, 5xx).
     */
    [[nodiscard]] static bool retryable(const HttpResponse& response);

   private:
    [[nodiscard]] static HttpResponse fetch(const std::string& url, long timeoutSeconds);

    static std::size_t write(void* contents, std::size_t size, std::size_t nmemb, void* userp);
};
