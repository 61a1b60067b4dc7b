/**
 * @file test_sink.cpp
 * @brief Unit tests for console and fan-out sinks
 */

#include <catch2/catch.hpp>
#include "logging/sink.h"
#include "helpers/scripted_prober.h"
#include <sstream>

using namespace logging;

TEST_CASE("Console lines carry time, level, event and fields", "[sink]") {
    std::string line = ConsoleSink::format_line("2025-01-01 12:00:00", Level::INFO, "probe_response",
        {{"url", "https://shop.example/"}, {"status", 200}});

    REQUIRE(line == "2025-01-01 12:00:00 | INFO | probe_response status=200 url=https://shop.example/");
}

TEST_CASE("Console sink honours the minimum level", "[sink]") {
    std::ostringstream out;
    ConsoleSink sink(out, Level::WARNING);

    sink.log(Level::INFO, "probe_issued", {{"url", "https://a.example/"}});
    REQUIRE(out.str().empty());

    sink.log(Level::WARNING, "probe_failed", {{"error", "timed out"}});
    REQUIRE(out.str().find("| WARNING | probe_failed error=timed out") != std::string::npos);
}

TEST_CASE("Fan-out sink forwards to every sink", "[sink]") {
    auto a = std::make_shared<test_helpers::RecordingSink>();
    auto b = std::make_shared<test_helpers::RecordingSink>();
    FanoutSink fan;
    fan.add(a);
    fan.add(b);
    fan.add(nullptr);

    fan.log(Level::INFO, "decision", {{"confidence", "high"}});
    REQUIRE(a->events().size() == 1);
    REQUIRE(b->named("decision").size() == 1);
}
