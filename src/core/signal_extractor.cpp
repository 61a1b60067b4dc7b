// Header, cookie and body-marker checks

#include "signal_extractor.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

static bool starts_with_icase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

static std::string join(const std::vector<std::string>& items, size_t limit) {
    std::ostringstream oss;
    size_t n = std::min(limit, items.size());
    for (size_t i = 0; i < n; i++) {
        if (i) oss << ", ";
        oss << items[i];
    }
    if (items.size() > n) oss << ", ...";
    return oss.str();
}

SignalExtractor::SignalExtractor(const config::DetectorConfig& cfg)
    : cfg_(cfg) {
    for (const auto& m : cfg_.markers) {
        try {
            markers_.push_back({m.name, std::regex(m.pattern, std::regex::ECMAScript | std::regex::icase)});
        } catch (const std::regex_error& e) {
            throw std::runtime_error("marker '" + m.name + "' has an invalid pattern: " + e.what());
        }
    }
}

std::optional<Signal> SignalExtractor::header_signal(const ProbeResult& result) const {
    std::vector<std::string> names;
    for (const auto& h : result.headers) {
        if (starts_with_icase(h.first, cfg_.header_prefix) &&
            std::find(names.begin(), names.end(), h.first) == names.end()) {
            names.push_back(h.first);
        }
    }
    if (names.empty()) return std::nullopt;

    Signal s;
    s.kind = SignalKind::HEADER;
    s.items.assign(names.begin(), names.begin() + std::min(cfg_.max_header_names, names.size()));
    s.description = "Response headers contain " + cfg_.header_prefix + "* (" +
                    join(names, cfg_.max_header_names) + ")";
    return s;
}

std::optional<Signal> SignalExtractor::cookie_signal(const ProbeResult& result) const {
    std::vector<std::string> names;
    for (const auto& c : result.cookies) {
        if (starts_with_icase(c.name, cfg_.cookie_prefix) &&
            std::find(names.begin(), names.end(), c.name) == names.end()) {
            names.push_back(c.name);
        }
    }
    if (names.empty()) return std::nullopt;

    Signal s;
    s.kind = SignalKind::COOKIE;
    s.items.assign(names.begin(), names.begin() + std::min(cfg_.max_cookie_names, names.size()));
    s.description = "Found Shopify cookies: " + join(names, cfg_.max_cookie_names);
    return s;
}

std::vector<std::string> SignalExtractor::match_markers(const std::string& body) const {
    std::vector<std::string> hits;
    for (const auto& m : markers_) {
        if (std::regex_search(body, m.rx)) {
            hits.push_back(m.name);
        }
    }
    return hits;
}

std::optional<Signal> SignalExtractor::body_marker_signal(const std::string& body) const {
    std::vector<std::string> hits = match_markers(body);
    if (hits.empty()) return std::nullopt;

    Signal s;
    s.kind = SignalKind::BODY_MARKER;
    s.items = hits;
    s.description = "Page markup contains markers: " + join(hits, hits.size());
    return s;
}

SignalReport SignalExtractor::extract(const ProbeResult& result) const {
    SignalReport report;
    report.header = header_signal(result);
    report.cookie = cookie_signal(result);
    report.body_marker = body_marker_signal(result.body);
    return report;
}
