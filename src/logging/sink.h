#pragma once
#include "chain.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logging {

// Observers for detection progress.
// The detector reports what it does (requests issued, responses, signals,
// decisions) to a Sink; where that ends up is up to the caller. Every sink
// here can be shared between detection runs on different threads.

enum class Level {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

std::string to_string(Level level);

class Sink {
public:
    virtual ~Sink() = default;

    /**
     * @brief Record one event
     * @param level Severity
     * @param event Short event name ("probe_issued", "signal", "decision", ...)
     * @param fields Structured details of the event
     */
    virtual void log(Level level, const std::string& event, const nlohmann::json& fields) = 0;
};

/// Discards everything.
class NullSink : public Sink {
public:
    void log(Level, const std::string&, const nlohmann::json&) override {}
};

/// Writes "2025-01-01 12:00:00 | INFO | event key=value" lines to a stream.
class ConsoleSink : public Sink {
public:
    explicit ConsoleSink(std::ostream& out, Level min_level = Level::INFO);

    void log(Level level, const std::string& event, const nlohmann::json& fields) override;

    static std::string format_line(const std::string& timestamp, Level level,
                                   const std::string& event, const nlohmann::json& fields);

private:
    std::ostream& out_;
    Level min_level_;
    std::mutex mu_;
};

/// Forwards events into a hash-chained audit log.
class ChainSink : public Sink {
public:
    explicit ChainSink(ChainLogger& chain);

    void log(Level level, const std::string& event, const nlohmann::json& fields) override;

    /// Number of events the audit log refused to write.
    size_t dropped() const { return dropped_.load(); }

private:
    ChainLogger& chain_;
    std::atomic<size_t> dropped_{0};
};

/// Sends every event to all attached sinks.
class FanoutSink : public Sink {
public:
    void add(std::shared_ptr<Sink> sink);

    void log(Level level, const std::string& event, const nlohmann::json& fields) override;

private:
    std::vector<std::shared_ptr<Sink>> sinks_;
};

} // namespace logging
