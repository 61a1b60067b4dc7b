/**
 * @file detector.cpp
 * @brief Candidate loop and decision rules
 */

#include "detector.h"
#include "candidate_normalizer.h"

using json = nlohmann::json;

Detector::Detector(const Prober& prober, const config::DetectorConfig& cfg, logging::Sink& sink,
                   const std::atomic<bool>* cancel)
    : prober_(prober),
      cfg_(cfg),
      sink_(sink),
      cancel_(cancel),
      extractor_(cfg_),
      cart_(prober_, cfg_, sink_)
{}

void Detector::decide(const std::string& input, Verdict& verdict, Confidence confidence,
                      const std::string& final_url, const std::string& rule) const {
    verdict.is_shopify = true;
    verdict.confidence = confidence;
    verdict.resolved_url = final_url;
    sink_.log(logging::Level::INFO, "decision", {
        {"input", input},
        {"shopify", true},
        {"confidence", to_string(confidence)},
        {"rule", rule},
        {"final_url", final_url}
    });
}

Detector::State Detector::evaluate_candidate(const std::string& input, const std::string& candidate,
                                             Verdict& verdict) const {
    ProbeResult result;
    if (!prober_.probe(candidate, result)) {
        verdict.evidence.push_back("Could not open " + candidate + ": " + result.error);
        return State::TRY_NEXT_CANDIDATE;
    }
    const std::string& final_url = result.final_url;
    SignalReport report = extractor_.extract(result);

    // Vendor headers settle it on their own; the cart check only adds evidence
    if (const auto& header = report.header) {
        verdict.evidence.push_back(header->description);
        verdict.signals.push_back(*header);
        sink_.log(logging::Level::INFO, "signal", {{"input", input}, {"kind", "header"}, {"items", header->items}});

        CartCheck cart = cart_.verify(final_url);
        verdict.evidence.push_back(cart.message);
        if (auto s = cart.signal()) verdict.signals.push_back(*s);

        decide(input, verdict, Confidence::HIGH, final_url, "header");
        return State::DECIDED;
    }

    const auto& cookie = report.cookie;
    const auto& marker = report.body_marker;
    if (cookie) {
        verdict.evidence.push_back(cookie->description);
        verdict.signals.push_back(*cookie);
        sink_.log(logging::Level::INFO, "signal", {{"input", input}, {"kind", "cookie"}, {"items", cookie->items}});
    }
    if (marker) {
        verdict.evidence.push_back(marker->description);
        verdict.signals.push_back(*marker);
        sink_.log(logging::Level::INFO, "signal", {{"input", input}, {"kind", "body_marker"}, {"items", marker->items}});
    }

    CartCheck cart = cart_.verify(final_url);
    if (cart.ok) {
        verdict.evidence.push_back(cart.message);
        verdict.signals.push_back(*cart.signal());
        sink_.log(logging::Level::INFO, "signal", {{"input", input}, {"kind", "cart_endpoint"}, {"items", json::array({cart.url})}});
        decide(input, verdict, Confidence::HIGH, final_url, "cart_endpoint");
        return State::DECIDED;
    }

    if (cookie && marker) {
        verdict.evidence.push_back(cart.message);
        decide(input, verdict, Confidence::HIGH, final_url, "cookie+body_marker");
        return State::DECIDED;
    }

    if (cookie || marker) {
        verdict.evidence.push_back(cart.message);
        decide(input, verdict, Confidence::MEDIUM, final_url, cookie ? "cookie" : "body_marker");
        return State::DECIDED;
    }

    verdict.evidence.push_back("No Shopify signals on " + final_url);
    sink_.log(logging::Level::INFO, "no_signal", {{"input", input}, {"final_url", final_url}});
    return State::TRY_NEXT_CANDIDATE;
}

Verdict Detector::detect(const std::string& input) const {
    Verdict verdict;
    sink_.log(logging::Level::INFO, "detect_start", {{"input", input}});

    std::vector<std::string> candidates = normalize_candidates(input);
    if (candidates.empty()) {
        verdict.evidence.push_back("No candidate URLs could be derived from input");
        sink_.log(logging::Level::WARNING, "input_error", {{"input", input}});
    }

    State state = State::TRY_NEXT_CANDIDATE;
    for (const auto& candidate : candidates) {
        if (cancel_ && cancel_->load()) {
            verdict.evidence.push_back("Detection cancelled before " + candidate);
            sink_.log(logging::Level::WARNING, "cancelled", {{"input", input}, {"candidate", candidate}});
            break;
        }
        verdict.candidates_tried++;
        state = evaluate_candidate(input, candidate, verdict);
        if (state == State::DECIDED) break;
    }

    if (state != State::DECIDED) {
        verdict.is_shopify = false;
        verdict.confidence = Confidence::LOW;
        verdict.resolved_url.reset();
        sink_.log(logging::Level::INFO, "decision", {
            {"input", input},
            {"shopify", false},
            {"confidence", to_string(Confidence::LOW)},
            {"rule", "exhausted"}
        });
    }
    return verdict;
}
