/**
 * @file candidate_normalizer.cpp
 * @brief Input string to ordered candidate URLs
 */

#include "candidate_normalizer.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <regex>

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string extract_host(const std::string& url) {
    CURLU* h = curl_url();
    if (!h) return {};
    CURLUcode rc = curl_url_set(h, CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        curl_url_cleanup(h);
        return {};
    }
    char* host = nullptr;
    char* port = nullptr;
    curl_url_get(h, CURLUPART_HOST, &host, 0);
    curl_url_get(h, CURLUPART_PORT, &port, 0);

    std::string hostport;
    if (host && host[0] != '\0') {
        hostport = to_lower(host);
        if (port) {
            hostport += ":";
            hostport += port;
        }
    }
    if (host) curl_free(host);
    if (port) curl_free(port);
    curl_url_cleanup(h);
    return hostport;
}

std::string counterpart_host(const std::string& host) {
    if (host.rfind("www.", 0) == 0) {
        return host.substr(4);
    }
    return "www." + host;
}

std::vector<std::string> normalize_candidates(const std::string& raw) {
    size_t b = raw.find_first_not_of(" \t\r\n\f\v");
    if (b == std::string::npos) return {};
    size_t e = raw.find_last_not_of(" \t\r\n\f\v");
    std::string input = raw.substr(b, e - b + 1);

    static const std::regex scheme_re(R"(^https?://)", std::regex::icase);
    if (!std::regex_search(input, scheme_re)) {
        input = "https://" + input;
    }

    std::string host = extract_host(input);
    if (host.empty()) return {};

    std::vector<std::string> hosts = {host};
    std::string other = counterpart_host(host);
    if (!other.empty() && other[0] != ':') {
        hosts.push_back(other);
    }

    std::vector<std::string> candidates;
    for (const auto& h : hosts) {
        for (const char* scheme : {"https", "http"}) {
            std::string url = std::string(scheme) + "://" + h + "/";
            if (std::find(candidates.begin(), candidates.end(), url) == candidates.end()) {
                candidates.push_back(url);
            }
        }
    }
    return candidates;
}
