#pragma once
#include "prober.h"
#include "config/detector_config.h"
#include <schema/verdict.h>
#include <optional>
#include <regex>
#include <string>
#include <vector>

// Looks for Shopify fingerprints in one probe response.
// Three independent checks, each reported as present or absent:
//   - response headers starting with the vendor header prefix
//   - cookies whose name starts with the vendor cookie prefix
//   - vendor markers (CDN host, JS globals, theme namespace, wallet script,
//     primary domain) anywhere in the body
// All three run on every response; weighing them is the detector's job.

struct SignalReport {
    std::optional<Signal> header;
    std::optional<Signal> cookie;
    std::optional<Signal> body_marker;

    bool has_any() const {
        return header.has_value() || cookie.has_value() || body_marker.has_value();
    }
};

class SignalExtractor {
public:
    /**
     * @brief Compile the marker table from the configuration
     * @param cfg Prefixes, markers and evidence limits
     * @throws std::runtime_error if a marker pattern does not compile
     */
    explicit SignalExtractor(const config::DetectorConfig& cfg);

    /**
     * @brief Run all three checks on a response
     * @param result Response of one candidate
     * @return Report with each signal present or absent
     */
    SignalReport extract(const ProbeResult& result) const;

    std::optional<Signal> header_signal(const ProbeResult& result) const;
    std::optional<Signal> cookie_signal(const ProbeResult& result) const;
    std::optional<Signal> body_marker_signal(const std::string& body) const;

    /**
     * @brief Names of all markers found in a body, in table order
     * @param body Response body
     * @return Matched marker identifiers
     */
    std::vector<std::string> match_markers(const std::string& body) const;

private:
    struct CompiledMarker {
        std::string name;
        std::regex rx;
    };

    config::DetectorConfig cfg_;
    std::vector<CompiledMarker> markers_;
};
