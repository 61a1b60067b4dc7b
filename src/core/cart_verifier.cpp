/**
 * @file cart_verifier.cpp
 * @brief /cart.js probe and JSON shape check
 */

#include "cart_verifier.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

std::optional<Signal> CartCheck::signal() const {
    if (!ok) return std::nullopt;
    Signal s;
    s.kind = SignalKind::CART_ENDPOINT;
    s.description = message;
    s.items = {url};
    return s;
}

CartVerifier::CartVerifier(const Prober& prober, const config::DetectorConfig& cfg, logging::Sink& sink)
    : prober_(prober), cfg_(cfg), sink_(sink) {}

std::string CartVerifier::endpoint_url(const std::string& base, const std::string& path) {
    CURLU* h = curl_url();
    if (!h) return {};
    if (curl_url_set(h, CURLUPART_URL, base.c_str(), 0) != CURLUE_OK ||
        curl_url_set(h, CURLUPART_PATH, path.c_str(), 0) != CURLUE_OK ||
        curl_url_set(h, CURLUPART_QUERY, nullptr, 0) != CURLUE_OK ||
        curl_url_set(h, CURLUPART_FRAGMENT, nullptr, 0) != CURLUE_OK) {
        curl_url_cleanup(h);
        return {};
    }
    char* out = nullptr;
    std::string url;
    if (curl_url_get(h, CURLUPART_URL, &out, 0) == CURLUE_OK && out) {
        url = out;
    }
    if (out) curl_free(out);
    curl_url_cleanup(h);
    return url;
}

bool CartVerifier::has_cart_keys(const std::string& body, const std::vector<std::string>& keys,
                                 std::string& error) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded()) {
        error = "response body is not valid JSON";
        return false;
    }
    if (!data.is_object()) {
        return false;
    }
    return std::any_of(keys.begin(), keys.end(),
                       [&](const std::string& k) { return data.contains(k); });
}

CartCheck CartVerifier::verify(const std::string& final_url) const {
    CartCheck check;
    check.url = endpoint_url(final_url, cfg_.cart_path);
    if (check.url.empty()) {
        check.message = cfg_.cart_path + " error: cannot build endpoint URL from " + final_url;
        sink_.log(logging::Level::WARNING, "cart_check", {{"base", final_url}, {"error", check.message}});
        return check;
    }

    sink_.log(logging::Level::INFO, "cart_check", {{"url", check.url}});

    ProbeResult result;
    if (!prober_.probe(check.url, result)) {
        check.message = cfg_.cart_path + " error: " + result.error;
        sink_.log(logging::Level::WARNING, "cart_check_failed", {{"url", check.url}, {"error", result.error}});
        return check;
    }

    check.status = result.status;
    check.content_type = result.header("content-type");
    std::transform(check.content_type.begin(), check.content_type.end(), check.content_type.begin(),
                   [](unsigned char c){ return std::tolower(c); });

    sink_.log(logging::Level::INFO, "cart_check_response", {
        {"url", check.url},
        {"status", check.status},
        {"content_type", check.content_type}
    });

    if (check.status == 200 && check.content_type.rfind("application/json", 0) == 0) {
        std::string parse_error;
        if (has_cart_keys(result.body, cfg_.cart_keys, parse_error)) {
            check.ok = true;
            check.message = "Reachable " + check.url + " (valid JSON with Shopify cart keys)";
            return check;
        }
        if (!parse_error.empty()) {
            check.message = cfg_.cart_path + " error: " + parse_error;
            sink_.log(logging::Level::WARNING, "cart_check_failed", {{"url", check.url}, {"error", parse_error}});
            return check;
        }
    }

    check.message = cfg_.cart_path + " did not confirm Shopify (status=" +
                    std::to_string(check.status) + ", type=" + check.content_type + ")";
    return check;
}
