#pragma once
#include "prober.h"
#include "signal_extractor.h"
#include "cart_verifier.h"
#include "config/detector_config.h"
#include "logging/sink.h"
#include <schema/verdict.h>
#include <atomic>
#include <string>

// Decides whether the site behind a user input runs on Shopify.
//
// Candidates from normalize_candidates() are probed one at a time, in order.
// The first candidate that yields any signal decides the verdict:
//   1. vendor headers                        -> Shopify, high
//   2. cart endpoint answers with cart JSON  -> Shopify, high
//   3. vendor cookies and body markers       -> Shopify, high
//   4. vendor cookies or body markers        -> Shopify, medium
// A candidate that fails or shows nothing moves on to the next one. When the
// list runs out the verdict is "not Shopify, low". The cart endpoint can only
// raise confidence; a negative answer is kept as evidence and nothing else.
//
// A Detector holds no per-run state, so one instance can serve concurrent
// detect() calls as long as its Prober and Sink can.

class Detector {
public:
    enum class State {
        TRY_NEXT_CANDIDATE,
        DECIDED
    };

    /**
     * @brief Create a detector
     * @param prober Network access for the main and the cart probes
     * @param cfg Fingerprint table and limits
     * @param sink Receives progress events
     * @param cancel Optional flag; once true, no further candidates are probed
     * @throws std::runtime_error if a configured marker pattern is invalid
     */
    Detector(const Prober& prober, const config::DetectorConfig& cfg, logging::Sink& sink,
             const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Run one detection
     * @param input Hostname or URL as typed by the user
     * @return Verdict with the evidence of every visited candidate
     *
     * Never throws for bad input or network trouble; those end up as a
     * negative, low-confidence verdict with notes in the evidence.
     */
    Verdict detect(const std::string& input) const;

private:
    const Prober& prober_;
    config::DetectorConfig cfg_;
    logging::Sink& sink_;
    const std::atomic<bool>* cancel_;
    SignalExtractor extractor_;
    CartVerifier cart_;

    /**
     * @brief Evaluate one candidate
     * @param input Raw user input, for log context
     * @param candidate Root URL to probe
     * @param verdict Evidence is appended; verdict fields are set when deciding
     * @return DECIDED if this candidate settled the verdict
     */
    State evaluate_candidate(const std::string& input, const std::string& candidate,
                             Verdict& verdict) const;

    void decide(const std::string& input, Verdict& verdict, Confidence confidence,
                const std::string& final_url, const std::string& rule) const;
};
