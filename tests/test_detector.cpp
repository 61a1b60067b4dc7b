/**
 * @file test_detector.cpp
 * @brief Unit tests for the decision rules and candidate loop
 *
 * All network traffic is scripted. Each rule is tested on its own:
 * header > cart endpoint > cookie+marker > cookie-or-marker > next candidate.
 */

#include <catch2/catch.hpp>
#include "core/detector.h"
#include "core/candidate_normalizer.h"
#include "helpers/scripted_prober.h"
#include <thread>

using namespace test_helpers;

static const char* const kRoot = "https://shop.example/";
static const char* const kCart = "https://shop.example/cart.js";

static bool contains(const std::vector<std::string>& v, const std::string& needle) {
    for (const auto& s : v) {
        if (s.find(needle) != std::string::npos) return true;
    }
    return false;
}

TEST_CASE("Vendor header decides high regardless of everything else", "[detector][header]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    prober.respond(kRoot, make_response(kRoot)
        .with_header("X-Shopify-Stage", "production")
        .with_body("<html>nothing here</html>"));

    SECTION("Cart check negative") {
        prober.fail(kCart, "timed out");
        Verdict v = detector.detect("shop.example");

        REQUIRE(v.is_shopify);
        REQUIRE(v.confidence == Confidence::HIGH);
        REQUIRE(v.resolved_url == std::string(kRoot));
        REQUIRE(v.evidence.size() == 2);
        REQUIRE(v.evidence[0].find("X-Shopify-*") != std::string::npos);
        REQUIRE(v.evidence[1] == "/cart.js error: timed out");
        REQUIRE(v.candidates_tried == 1);
    }

    SECTION("Cart check positive adds evidence") {
        prober.respond(kCart, make_response(kCart).json_body(R"({"token":"t"})"));
        Verdict v = detector.detect("shop.example");

        REQUIRE(v.confidence == Confidence::HIGH);
        REQUIRE(v.signals.size() == 2);
        REQUIRE(v.signals[1].kind == SignalKind::CART_ENDPOINT);
    }

    SECTION("Later candidates are never probed") {
        Verdict v = detector.detect("shop.example");
        REQUIRE(v.is_shopify);
        REQUIRE(prober.calls() == std::vector<std::string>{kRoot, kCart});
    }

    SECTION("Cookies and markers on the same response are not reported") {
        prober.respond(kRoot, make_response(kRoot)
            .with_header("X-Shopify-Stage", "production")
            .with_cookie("_shopify_y", "abc")
            .with_body("<script src=\"https://cdn.shopify.com/s/app.js\"></script>"));
        prober.fail(kCart, "timed out");
        Verdict v = detector.detect("shop.example");

        REQUIRE(v.is_shopify);
        REQUIRE(v.confidence == Confidence::HIGH);
        REQUIRE(v.evidence.size() == 2);
        REQUIRE_FALSE(contains(v.evidence, "Found Shopify cookies"));
        REQUIRE_FALSE(contains(v.evidence, "Page markup contains markers"));
        REQUIRE(v.signals.size() == 1);
        REQUIRE(v.signals[0].kind == SignalKind::HEADER);

        auto decisions = sink.named("decision");
        REQUIRE(decisions.size() == 1);
        REQUIRE(decisions[0].fields["rule"] == "header");
    }
}

TEST_CASE("Cart endpoint alone decides high", "[detector][cart]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    prober.respond(kRoot, make_response(kRoot).with_body("<html>headless storefront</html>"));
    prober.respond(kCart, make_response(kCart).json_body(R"({"token":"abc","note":null})"));

    Verdict v = detector.detect("shop.example");
    REQUIRE(v.is_shopify);
    REQUIRE(v.confidence == Confidence::HIGH);
    REQUIRE(v.resolved_url == std::string(kRoot));
    REQUIRE(v.evidence == std::vector<std::string>{
        "Reachable https://shop.example/cart.js (valid JSON with Shopify cart keys)"});
}

TEST_CASE("Cookie and marker together decide high", "[detector][cookie][body]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    prober.respond(kRoot, make_response(kRoot)
        .with_cookie("_shopify_y", "1")
        .with_body("<script src=\"https://cdn.shopify.com/x.js\"></script>"));
    prober.respond(kCart, make_response(kCart, 403).with_header("Content-Type", "text/html"));

    Verdict v = detector.detect("shop.example");
    REQUIRE(v.is_shopify);
    REQUIRE(v.confidence == Confidence::HIGH);
    REQUIRE(v.evidence.size() == 3);
    REQUIRE(v.evidence[0] == "Found Shopify cookies: _shopify_y");
    REQUIRE(v.evidence[1] == "Page markup contains markers: cdn.shopify.com");
    REQUIRE(v.evidence[2] == "/cart.js did not confirm Shopify (status=403, type=text/html)");
}

TEST_CASE("Cookie or marker alone decides medium", "[detector][cookie][body]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);
    prober.fail(kCart, "Connection reset by peer");

    SECTION("Cookie only") {
        prober.respond(kRoot, make_response(kRoot).with_cookie("_shopify_s", "1"));
        Verdict v = detector.detect("shop.example");

        REQUIRE(v.is_shopify);
        REQUIRE(v.confidence == Confidence::MEDIUM);
        REQUIRE(v.evidence.back() == "/cart.js error: Connection reset by peer");
    }

    SECTION("Marker only") {
        prober.respond(kRoot, make_response(kRoot).with_body("<script>window.Shopify = {};</script>"));
        Verdict v = detector.detect("shop.example");

        REQUIRE(v.is_shopify);
        REQUIRE(v.confidence == Confidence::MEDIUM);
        REQUIRE(v.resolved_url == std::string(kRoot));
        REQUIRE(contains(v.evidence, "window.Shopify"));
    }
}

TEST_CASE("Silent candidate moves on to the next one", "[detector][loop]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    prober.respond(kRoot, make_response(kRoot).with_body("<html>plain</html>"));
    prober.respond(kCart, make_response(kCart, 404));
    prober.fail("http://shop.example/", "Connection refused");
    prober.respond("https://www.shop.example/", make_response("https://www.shop.example/")
        .with_header("X-Shopify-Stage", "production"));

    Verdict v = detector.detect("shop.example");
    REQUIRE(v.is_shopify);
    REQUIRE(v.confidence == Confidence::HIGH);
    REQUIRE(v.resolved_url == std::string("https://www.shop.example/"));
    REQUIRE(v.candidates_tried == 3);
    REQUIRE(v.evidence[0] == "No Shopify signals on https://shop.example/");
    REQUIRE(v.evidence[1] == "Could not open http://shop.example/: Connection refused");
    REQUIRE(v.evidence[2].find("X-Shopify-*") != std::string::npos);
}

TEST_CASE("Resolved URL is the final URL after redirects", "[detector][loop]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    const std::string landed = "https://www.shop.example/en/";
    prober.respond(kRoot, make_response(landed).with_body("Shopify.theme = {}"));

    Verdict v = detector.detect("shop.example");
    REQUIRE(v.resolved_url == landed);
    REQUIRE(prober.calls()[1] == "https://www.shop.example/cart.js");
}

TEST_CASE("All candidates unreachable gives a negative low verdict", "[detector][loop]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    Verdict v = detector.detect("nowhere.example");
    REQUIRE_FALSE(v.is_shopify);
    REQUIRE(v.confidence == Confidence::LOW);
    REQUIRE_FALSE(v.resolved_url.has_value());
    REQUIRE(v.candidates_tried == 4);
    REQUIRE(v.evidence.size() == 4);
    for (const auto& e : v.evidence) {
        REQUIRE(e.find("Could not open ") == 0);
    }
    REQUIRE(prober.call_count() == 4);
}

TEST_CASE("No signals anywhere gives a negative low verdict", "[detector][loop]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    for (const auto& c : normalize_candidates("plain.example")) {
        prober.respond(c, make_response(c).with_body("<html>WordPress</html>"));
    }

    Verdict v = detector.detect("plain.example");
    REQUIRE_FALSE(v.is_shopify);
    REQUIRE(v.confidence == Confidence::LOW);
    REQUIRE(v.evidence.size() == 4);
    REQUIRE(v.evidence[3] == "No Shopify signals on http://www.plain.example/");
}

TEST_CASE("Empty input makes no network calls", "[detector][input]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    for (const std::string in : {"", "   ", "\t\n"}) {
        Verdict v = detector.detect(in);
        REQUIRE_FALSE(v.is_shopify);
        REQUIRE(v.confidence == Confidence::LOW);
        REQUIRE_FALSE(v.resolved_url.has_value());
        REQUIRE(v.evidence == std::vector<std::string>{"No candidate URLs could be derived from input"});
    }
    REQUIRE(prober.call_count() == 0);
    REQUIRE(sink.named("input_error").size() == 3);
}

TEST_CASE("Cancellation stops before the next candidate", "[detector][cancel]") {
    ScriptedProber prober;
    RecordingSink sink;
    std::atomic<bool> cancel{true};
    Detector detector(prober, config::DetectorConfig::get_default(), sink, &cancel);

    Verdict v = detector.detect("shop.example");
    REQUIRE_FALSE(v.is_shopify);
    REQUIRE(v.candidates_tried == 0);
    REQUIRE(prober.call_count() == 0);
    REQUIRE(v.evidence == std::vector<std::string>{"Detection cancelled before https://shop.example/"});
}

TEST_CASE("Decisions are reported to the sink", "[detector][logging]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    prober.respond(kRoot, make_response(kRoot).with_cookie("_shopify_y", "1"));
    Verdict v = detector.detect("shop.example");

    auto decisions = sink.named("decision");
    REQUIRE(decisions.size() == 1);
    REQUIRE(decisions[0].fields["confidence"] == "medium");
    REQUIRE(decisions[0].fields["rule"] == "cookie");
    REQUIRE(decisions[0].fields["input"] == "shop.example");
    REQUIRE(sink.named("signal").size() == 1);
}

TEST_CASE("Verdict serialises to JSON", "[detector][schema]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);
    prober.respond(kRoot, make_response(kRoot).with_body("cdn.shopify.com"));

    nlohmann::json j = detector.detect("shop.example").to_json();
    REQUIRE(j["is_shopify"] == true);
    REQUIRE(j["confidence"] == "medium");
    REQUIRE(j["resolved_url"] == kRoot);
    REQUIRE(j["signals"][0]["kind"] == "body_marker");

    nlohmann::json neg = detector.detect("").to_json();
    REQUIRE(neg["resolved_url"].is_null());
    REQUIRE(neg["confidence"] == "low");
}

TEST_CASE("Verdict output survives bytes that are not UTF-8", "[detector][schema]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    const std::string input = "sh\xF6p.invalid";
    Verdict v = detector.detect(input);
    REQUIRE_FALSE(v.is_shopify);

    v.evidence.push_back("Could not open https://" + input + "/: timed out");
    v.evidence.push_back("Found Shopify cookies: _shopify_\xF6");
    nlohmann::json j = v.to_json();
    j["input"] = input;

    std::string text;
    REQUIRE_NOTHROW(text = dump_json(j, 2));
    REQUIRE(text.find("sh\xEF\xBF\xBDp.invalid") != std::string::npos);

    nlohmann::json back = nlohmann::json::parse(text);
    REQUIRE(back["evidence"].size() == v.evidence.size());
}

TEST_CASE("Concurrent detections are independent", "[detector][concurrency]") {
    ScriptedProber prober;
    RecordingSink sink;
    Detector detector(prober, config::DetectorConfig::get_default(), sink);

    prober.respond(kRoot, make_response(kRoot).with_header("X-Shopify-Stage", "production"));
    for (const auto& c : normalize_candidates("plain.example")) {
        prober.respond(c, make_response(c));
    }

    std::vector<Verdict> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); i++) {
        threads.emplace_back([&, i] {
            results[i] = detector.detect(i % 2 == 0 ? "shop.example" : "plain.example");
        });
    }
    for (auto& t : threads) t.join();

    for (size_t i = 0; i < results.size(); i++) {
        if (i % 2 == 0) {
            REQUIRE(results[i].is_shopify);
            REQUIRE(results[i].evidence.size() == 2);
        } else {
            REQUIRE_FALSE(results[i].is_shopify);
            REQUIRE(results[i].evidence.size() == 4);
        }
    }
    REQUIRE(sink.named("decision").size() == results.size());
}
