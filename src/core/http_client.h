#pragma once
#include <atomic>
#include <string>
#include <map>
#include <vector>

// HTTP client wrapper around libcurl.
// Provides a simple interface for making HTTP requests with configurable
// timeouts, redirect handling, and custom headers. Only the headers and
// cookies of the final response in a redirect chain are kept.

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpCookie {
    std::string name;
    std::string value;
};

struct HttpResponse {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;   // names lower-cased
    std::vector<HttpCookie> cookies;
    std::string body;
    std::string effective_url;
    std::string error;
    double total_time = 0.0;
    size_t body_bytes = 0;

    /**
     * @brief Case-insensitive lookup of the first header with this name
     * @param name Header name in any case
     * @return Header value, or empty string if absent
     */
    std::string header(const std::string& name) const;
};

class HttpClient {
public:
    static const char* const kBrowserUserAgent;

    struct Options {
        long timeout_seconds;
        long connect_timeout_seconds;
        bool follow_redirects;
        long max_redirects;
        std::string user_agent;
        bool accept_encoding;
        const std::atomic<bool>* abort_flag;   // Transfer aborts once this turns true

        Options()
            : timeout_seconds(8),
              connect_timeout_seconds(8),
              follow_redirects(true),
              max_redirects(10),
              user_agent(kBrowserUserAgent),
              accept_encoding(true),
              abort_flag(nullptr)
        {}
    };

    /**
     * @brief Create an HTTP client with the given options
     * @param opts Client configuration (timeouts, redirects, etc.)
     */
    explicit HttpClient(const Options& opts = Options());

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Make an HTTP request and fill in the response
     * @param req Request details (method, URL, headers, body)
     * @param resp Response object that gets populated
     * @return true if request succeeded, false on error (resp.error is set)
     */
    bool perform(const HttpRequest& req, HttpResponse& resp) const;

    const Options& options() const { return opts_; }

    /**
     * @brief Parse the name and value out of one Set-Cookie header value
     * @param set_cookie_header e.g. "_shopify_y=abc; Path=/; Secure"
     * @param cookie Filled with name and value
     * @return false if the header carries no name=value pair
     */
    static bool parse_set_cookie(const std::string& set_cookie_header, HttpCookie& cookie);

private:
    Options opts_;
};
