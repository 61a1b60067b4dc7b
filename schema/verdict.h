#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @file verdict.h
 * @brief Result of one detection run
 *
 * Holds the Shopify/not-Shopify decision, how sure we are about it, the URL
 * the decision was made on, and the evidence trail in discovery order.
 */

enum class Confidence {
    HIGH,
    MEDIUM,
    LOW
};

enum class SignalKind {
    HEADER,
    COOKIE,
    BODY_MARKER,
    CART_ENDPOINT
};

inline std::string to_string(Confidence c) {
    switch (c) {
        case Confidence::HIGH:   return "high";
        case Confidence::MEDIUM: return "medium";
        case Confidence::LOW:    return "low";
    }
    return "low";
}

inline std::optional<Confidence> parse_confidence(const std::string& s) {
    if (s == "high") return Confidence::HIGH;
    if (s == "medium") return Confidence::MEDIUM;
    if (s == "low") return Confidence::LOW;
    return std::nullopt;
}

inline std::string to_string(SignalKind k) {
    switch (k) {
        case SignalKind::HEADER:        return "header";
        case SignalKind::COOKIE:        return "cookie";
        case SignalKind::BODY_MARKER:   return "body_marker";
        case SignalKind::CART_ENDPOINT: return "cart_endpoint";
    }
    return "unknown";
}

// One piece of evidence that a site runs on Shopify
struct Signal {
    SignalKind kind;
    std::string description;          // Human-readable evidence line
    std::vector<std::string> items;   // Header/cookie names, marker ids or endpoint URL
};

struct Verdict {
    bool is_shopify = false;
    Confidence confidence = Confidence::LOW;
    std::optional<std::string> resolved_url;
    std::vector<std::string> evidence;   // Everything noted, in visiting order
    std::vector<Signal> signals;         // Positive signals only
    int candidates_tried = 0;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["is_shopify"] = is_shopify;
        j["confidence"] = to_string(confidence);
        j["resolved_url"] = resolved_url ? nlohmann::json(*resolved_url) : nlohmann::json(nullptr);
        j["evidence"] = evidence;
        j["signals"] = nlohmann::json::array();
        for (const auto& s : signals) {
            j["signals"].push_back({
                {"kind", to_string(s.kind)},
                {"description", s.description},
                {"items", s.items}
            });
        }
        j["candidates_tried"] = candidates_tried;
        return j;
    }
};

/**
 * @brief Serialise JSON for output
 *
 * Evidence carries bytes taken from user input and from remote servers, so
 * anything that is not valid UTF-8 is written as U+FFFD instead of throwing.
 */
inline std::string dump_json(const nlohmann::json& j, int indent = -1) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}
