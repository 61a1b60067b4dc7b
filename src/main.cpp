#include "core/http_client.h"
#include "core/prober.h"
#include "core/detector.h"
#include "config/detector_config.h"
#include "logging/chain.h"
#include "logging/sink.h"
#include <schema/verdict.h>
#include <iostream>
#include <memory>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

/**
 * @brief Generates a unique identifier for a program run based on current UTC datetime
 * @return A string representing the run identifier
 */
std::string generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << "run_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

/**
 * @brief Print a verdict for people
 * @param input Input the detection was run on
 * @param v Verdict to print
 */
void print_verdict(const std::string& input, const Verdict& v) {
    std::cout << "Input: " << input << "\n";
    if (v.is_shopify) {
        std::cout << "Result: looks like a Shopify store (confidence: " << to_string(v.confidence) << ")\n";
    } else {
        std::cout << "Result: no signs of Shopify found\n";
    }
    if (v.resolved_url) {
        std::cout << "Resolved URL: " << *v.resolved_url << "\n";
    }
    if (!v.evidence.empty()) {
        std::cout << "Evidence:\n";
        for (const auto& e : v.evidence) {
            std::cout << "  - " << e << "\n";
        }
    }
}

/**
 * @brief Run one detection and report it
 * @param argc Argument count from command line
 * @param argv Argument values from command line
 * @return 0 if Shopify, 1 if not, 2 on usage or configuration errors
 */
int cmd_check(int argc, char** argv) {
    std::string input;
    std::string config_path;
    std::string log_path;
    bool as_json = false;
    bool quiet = false;
    bool verbose = false;
    bool have_input = false;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--log" && i + 1 < argc) {
            log_path = argv[++i];
        } else if (a == "--json") {
            as_json = true;
        } else if (a == "--quiet") {
            quiet = true;
        } else if (a == "--verbose") {
            verbose = true;
        } else if (!have_input) {
            input = a;
            have_input = true;
        } else {
            std::cerr << "Unexpected argument: " << a << "\n";
            return 2;
        }
    }

    if (!have_input) {
        std::cerr << "Usage: shopcheck check <host-or-url> [--config FILE] [--log FILE] [--json] [--quiet] [--verbose]\n";
        return 2;
    }

    config::DetectorConfig cfg;
    try {
        cfg = config_path.empty() ? config::DetectorConfig::get_default()
                                  : config::DetectorConfig::load(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    // The audit chain must outlive every sink that refers to it
    std::unique_ptr<logging::ChainLogger> chain;
    std::shared_ptr<logging::ChainSink> chain_sink;

    logging::FanoutSink sink;
    if (!quiet) {
        sink.add(std::make_shared<logging::ConsoleSink>(
            std::cerr, verbose ? logging::Level::DEBUG : logging::Level::INFO));
    }
    if (!log_path.empty()) {
        chain = std::make_unique<logging::ChainLogger>(log_path, generate_run_id());
        chain_sink = std::make_shared<logging::ChainSink>(*chain);
        sink.add(chain_sink);
    }

    HttpClient::Options opts;
    opts.timeout_seconds = cfg.timeout_seconds;
    opts.connect_timeout_seconds = cfg.timeout_seconds;
    opts.follow_redirects = true;
    opts.user_agent = cfg.user_agent;

    Verdict verdict;
    try {
        HttpClient client(opts);
        HttpProber prober(client, sink);
        Detector detector(prober, cfg, sink);
        verdict = detector.detect(input);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (chain_sink && chain_sink->dropped() > 0) {
        std::cerr << "Warning: " << chain_sink->dropped() << " event(s) could not be written to " << log_path << "\n";
    }

    if (as_json) {
        nlohmann::json j = verdict.to_json();
        j["input"] = input;
        std::cout << dump_json(j, 2) << "\n";
    } else {
        print_verdict(input, verdict);
    }

    return verdict.is_shopify ? 0 : 1;
}

/**
 * @brief Verifies the integrity of an audit log
 * @param argc Argument count from the command line
 * @param argv Argument values from the command line; argv[2] should be the log file path
 * @return 0 if verification succeeds, 1 if it fails, 2 if usage is incorrect
 */
int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: shopcheck verify <log-file.jsonl>\n";
        return 2;
    }

    std::string log_path = argv[2];
    std::string problem;
    if (logging::ChainLogger::verify(log_path, &problem)) {
        std::cout << log_path << ": chain intact\n";
        return 0;
    }
    std::cerr << log_path << ": verification failed: " << problem << "\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage:\n";
        std::cerr << "  shopcheck check <host-or-url> [--config FILE] [--log FILE] [--json] [--quiet] [--verbose]\n";
        std::cerr << "  shopcheck verify <log-file.jsonl>\n";
        return 2;
    }

    std::string command = argv[1];

    if (command == "check") {
        return cmd_check(argc, argv);
    } else if (command == "verify") {
        return cmd_verify(argc, argv);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        return 2;
    }
}
