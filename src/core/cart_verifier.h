#pragma once
#include "prober.h"
#include "config/detector_config.h"
#include "logging/sink.h"
#include <schema/verdict.h>
#include <optional>
#include <string>

// Second opinion from the storefront cart API.
// A Shopify store answers GET /cart.js with a JSON cart object. A positive
// answer is strong evidence on its own; anything else (wrong status or
// content type, bad JSON, network error) only produces an explanatory note.
// verify() never throws.

struct CartCheck {
    bool ok = false;
    std::string url;            // Cart endpoint that was requested
    long status = 0;
    std::string content_type;   // Lower-cased Content-Type of the response
    std::string message;        // Evidence line, positive or negative

    /**
     * @brief Evidence signal for a positive check
     * @return CART_ENDPOINT signal, or nullopt when the check was negative
     */
    std::optional<Signal> signal() const;
};

class CartVerifier {
public:
    CartVerifier(const Prober& prober, const config::DetectorConfig& cfg, logging::Sink& sink);

    /**
     * @brief Probe the cart endpoint of the site behind final_url
     * @param final_url Resolved URL of a candidate (after redirects)
     * @return Outcome with an evidence message
     */
    CartCheck verify(const std::string& final_url) const;

    /**
     * @brief Resolve an absolute path against the origin of a URL
     * @param base Any absolute URL on the site
     * @param path Absolute path such as "/cart.js"
     * @return scheme://host[:port]/path, or empty string if base is not a URL
     */
    static std::string endpoint_url(const std::string& base, const std::string& path);

    /**
     * @brief Check whether a body is a JSON object with one of the expected keys
     * @param body Response body
     * @param keys Keys of which at least one must be present at top level
     * @param error Set to the parse error when the body is not JSON
     * @return true if the body qualifies
     */
    static bool has_cart_keys(const std::string& body, const std::vector<std::string>& keys,
                              std::string& error);

private:
    const Prober& prober_;
    config::DetectorConfig cfg_;
    logging::Sink& sink_;
};
