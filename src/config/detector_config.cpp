// Detector configuration: defaults, JSON and YAML loading

#include "detector_config.h"
#include "core/http_client.h"
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace config {

using json = nlohmann::json;

DetectorConfig DetectorConfig::get_default() {
    DetectorConfig c;
    c.header_prefix = "X-Shopify-";
    c.cookie_prefix = "_shopify";
    c.markers = {
        {"cdn.shopify.com",        R"(cdn\.shopify\.com)"},
        {"myshopify.com",          R"(\bmyshopify\.com\b)"},
        {"window.Shopify",         R"(window\.Shopify\b)"},
        {"Shopify.theme",          R"(Shopify\.theme\b)"},
        {"shopify-digital-wallet", R"(shopify-digital-wallet)"},
    };
    c.cart_path = "/cart.js";
    c.cart_keys = {"items", "token", "attributes"};
    c.user_agent = HttpClient::kBrowserUserAgent;
    c.timeout_seconds = 8;
    c.max_header_names = 5;
    c.max_cookie_names = 6;
    return c;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::string unquote(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                          (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing " # comment" but keep '#' inside quoted values
static std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || line[i-1] == ' ' || line[i-1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

static long parse_long(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        long v = std::stol(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw std::runtime_error("config: '" + key + "' expects an integer, got '" + value + "'");
    }
}

static size_t to_count(const std::string& key, long v) {
    if (v < 1) {
        throw std::runtime_error("config: '" + key + "' must be at least 1, got " + std::to_string(v));
    }
    return static_cast<size_t>(v);
}

static std::vector<std::string> parse_inline_list(const std::string& value) {
    std::vector<std::string> out;
    std::string inner = value.substr(1, value.size() - 2);
    std::istringstream iss(inner);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

static void apply_scalar(DetectorConfig& c, const std::string& key, const std::string& value) {
    if (key == "header_prefix") {
        c.header_prefix = value;
    } else if (key == "cookie_prefix") {
        c.cookie_prefix = value;
    } else if (key == "cart_path") {
        c.cart_path = value;
    } else if (key == "user_agent") {
        c.user_agent = value;
    } else if (key == "timeout_seconds") {
        c.timeout_seconds = parse_long(key, value);
    } else if (key == "max_header_names") {
        c.max_header_names = to_count(key, parse_long(key, value));
    } else if (key == "max_cookie_names") {
        c.max_cookie_names = to_count(key, parse_long(key, value));
    } else {
        std::cerr << "Warning: unknown config key '" << key << "' ignored\n";
    }
}

// Supported YAML subset:
//   key: value
//   cart_keys: [items, token]      or a "- item" block list
//   markers:
//     - name: 'cdn.shopify.com'
//       pattern: 'cdn\.shopify\.com'
static DetectorConfig parse_yaml(const std::string& content) {
    DetectorConfig c = DetectorConfig::get_default();
    std::istringstream in(content);
    std::string raw;
    std::string list_key;

    while (std::getline(in, raw)) {
        std::string line = trim(strip_comment(raw));
        if (line.empty()) continue;

        bool indented = !raw.empty() && (raw[0] == ' ' || raw[0] == '\t' || raw[0] == '-');

        if (!indented) {
            list_key.clear();
            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                throw std::runtime_error("config: cannot parse line '" + line + "'");
            }
            std::string key = trim(line.substr(0, colon));
            std::string value = trim(line.substr(colon + 1));

            if (key == "markers" || key == "cart_keys") {
                if (key == "markers") {
                    c.markers.clear();
                } else {
                    c.cart_keys.clear();
                }
                if (value.empty()) {
                    list_key = key;
                } else if (key == "cart_keys" && value.front() == '[' && value.back() == ']') {
                    c.cart_keys = parse_inline_list(value);
                } else if (value != "[]") {
                    throw std::runtime_error("config: '" + key + "' expects a list");
                }
                continue;
            }
            apply_scalar(c, key, unquote(value));
            continue;
        }

        if (list_key.empty()) {
            throw std::runtime_error("config: unexpected indented line '" + line + "'");
        }

        bool new_item = line[0] == '-';
        if (new_item) line = trim(line.substr(1));

        if (list_key == "cart_keys") {
            c.cart_keys.push_back(unquote(line));
            continue;
        }

        // markers list: "name: x" / "pattern: y" pairs
        if (new_item) c.markers.emplace_back();
        if (c.markers.empty()) {
            throw std::runtime_error("config: marker field outside a list item: '" + line + "'");
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            throw std::runtime_error("config: cannot parse marker line '" + line + "'");
        }
        std::string key = trim(line.substr(0, colon));
        std::string value = unquote(trim(line.substr(colon + 1)));
        if (key == "name") {
            c.markers.back().name = value;
        } else if (key == "pattern") {
            c.markers.back().pattern = value;
        } else {
            throw std::runtime_error("config: unknown marker field '" + key + "'");
        }
    }

    return c;
}

static DetectorConfig parse_json(const std::string& content) {
    DetectorConfig c = DetectorConfig::get_default();
    try {
        json j = json::parse(content);
        if (!j.is_object()) {
            throw std::runtime_error("config: top-level JSON value must be an object");
        }
        c.header_prefix = j.value("header_prefix", c.header_prefix);
        c.cookie_prefix = j.value("cookie_prefix", c.cookie_prefix);
        c.cart_path = j.value("cart_path", c.cart_path);
        c.user_agent = j.value("user_agent", c.user_agent);
        c.timeout_seconds = j.value("timeout_seconds", c.timeout_seconds);
        if (j.contains("max_header_names")) {
            c.max_header_names = to_count("max_header_names", j["max_header_names"].get<long>());
        }
        if (j.contains("max_cookie_names")) {
            c.max_cookie_names = to_count("max_cookie_names", j["max_cookie_names"].get<long>());
        }

        if (j.contains("cart_keys")) {
            c.cart_keys = j["cart_keys"].get<std::vector<std::string>>();
        }
        if (j.contains("markers")) {
            c.markers.clear();
            for (const auto& m : j["markers"]) {
                MarkerPattern p;
                p.name = m.at("name").get<std::string>();
                p.pattern = m.at("pattern").get<std::string>();
                c.markers.push_back(p);
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("config: invalid JSON: ") + e.what());
    }
    return c;
}

DetectorConfig DetectorConfig::parse(const std::string& content) {
    std::string body = trim(content);
    DetectorConfig c = (!body.empty() && body.front() == '{') ? parse_json(body) : parse_yaml(content);
    c.validate();
    return c;
}

DetectorConfig DetectorConfig::load(const std::string& config_path) {
    std::ifstream in(config_path);
    if (!in.is_open()) {
        std::cerr << "Warning: Could not open config file " << config_path << ", using defaults\n";
        return get_default();
    }

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    return parse(content);
}

void DetectorConfig::validate() const {
    if (header_prefix.empty()) {
        throw std::runtime_error("config: header_prefix must not be empty");
    }
    if (cookie_prefix.empty()) {
        throw std::runtime_error("config: cookie_prefix must not be empty");
    }
    if (cart_path.empty() || cart_path.front() != '/') {
        throw std::runtime_error("config: cart_path must start with '/'");
    }
    if (cart_keys.empty()) {
        throw std::runtime_error("config: cart_keys must list at least one key");
    }
    if (timeout_seconds <= 0) {
        throw std::runtime_error("config: timeout_seconds must be positive");
    }
    if (max_header_names < 1 || max_cookie_names < 1) {
        throw std::runtime_error("config: max_header_names and max_cookie_names must be at least 1");
    }
    for (const auto& m : markers) {
        if (m.name.empty() || m.pattern.empty()) {
            throw std::runtime_error("config: every marker needs a name and a pattern");
        }
        try {
            std::regex rx(m.pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw std::runtime_error("config: marker '" + m.name + "' has an invalid pattern: " + e.what());
        }
    }
}

json DetectorConfig::to_json() const {
    json j;
    j["header_prefix"] = header_prefix;
    j["cookie_prefix"] = cookie_prefix;
    j["markers"] = json::array();
    for (const auto& m : markers) {
        j["markers"].push_back({{"name", m.name}, {"pattern", m.pattern}});
    }
    j["cart_path"] = cart_path;
    j["cart_keys"] = cart_keys;
    j["user_agent"] = user_agent;
    j["timeout_seconds"] = timeout_seconds;
    j["max_header_names"] = max_header_names;
    j["max_cookie_names"] = max_cookie_names;
    return j;
}

} // namespace config
