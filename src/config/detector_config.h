#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace config {

// Vendor fingerprints and request policy used by the detector.
// Everything a detection run matches against lives here so it can be
// replaced from a file or swapped out in tests.

struct MarkerPattern {
    std::string name;       // Identifier reported in evidence
    std::string pattern;    // ECMAScript regex, matched case-insensitively
};

struct DetectorConfig {
    std::string header_prefix;
    std::string cookie_prefix;
    std::vector<MarkerPattern> markers;

    std::string cart_path;
    std::vector<std::string> cart_keys;

    std::string user_agent;
    long timeout_seconds;

    size_t max_header_names;   // Header names quoted in evidence
    size_t max_cookie_names;   // Cookie names quoted in evidence

    DetectorConfig()
        : timeout_seconds(8),
          max_header_names(5),
          max_cookie_names(6)
    {}

    /**
     * @brief Get the built-in Shopify fingerprint table
     * @return Default configuration
     */
    static DetectorConfig get_default();

    /**
     * @brief Load configuration from a JSON or YAML file
     * @param config_path Path to detector.yaml / detector.json
     * @return Defaults overlaid with the values found in the file
     * @throws std::runtime_error if the file holds an invalid value
     *
     * A missing file is not an error: a warning is printed and the
     * defaults are returned.
     */
    static DetectorConfig load(const std::string& config_path);

    /**
     * @brief Parse configuration text (JSON first, then the YAML subset)
     * @param content File contents
     * @return Defaults overlaid with parsed values
     * @throws std::runtime_error on invalid values
     */
    static DetectorConfig parse(const std::string& content);

    /**
     * @brief Check prefixes, limits and that every marker regex compiles
     * @throws std::runtime_error describing the first problem found
     */
    void validate() const;

    nlohmann::json to_json() const;
};

} // namespace config
