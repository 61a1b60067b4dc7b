#pragma once
#include "http_client.h"
#include "logging/sink.h"
#include <string>
#include <vector>

// One GET against a candidate URL, as seen by the detector.
// Prober is the seam between detection logic and the network: HttpProber
// talks to real servers through libcurl, tests plug in scripted responses.

struct ProbeResult {
    std::string url;          // URL that was requested
    std::string final_url;    // URL after redirects
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<HttpCookie> cookies;
    std::string body;
    std::string error;        // Set when the probe failed

    /**
     * @brief Case-insensitive lookup of the first header with this name
     * @param name Header name in any case
     * @return Header value, or empty string if absent
     */
    std::string header(const std::string& name) const;
};

class Prober {
public:
    virtual ~Prober() = default;

    /**
     * @brief Fetch a URL with GET, following redirects
     * @param url Absolute URL to fetch
     * @param out Filled with the response, or with the error on failure
     * @return false on network-level failure (DNS, connect, TLS, timeout)
     *
     * HTTP error statuses are not failures; they come back as results.
     */
    virtual bool probe(const std::string& url, ProbeResult& out) const = 0;
};

class HttpProber : public Prober {
public:
    /**
     * @brief Create a prober on top of an HTTP client
     * @param client Client carrying the timeout, redirect and User-Agent policy
     * @param sink Receives probe_issued / probe_response / probe_failed events
     */
    HttpProber(const HttpClient& client, logging::Sink& sink);

    bool probe(const std::string& url, ProbeResult& out) const override;

private:
    const HttpClient& client_;
    logging::Sink& sink_;
};
