// Console, audit-chain and fan-out sinks

#include "sink.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace logging {

using json = nlohmann::json;

std::string to_string(Level level) {
    switch (level) {
        case Level::DEBUG:   return "DEBUG";
        case Level::INFO:    return "INFO";
        case Level::WARNING: return "WARNING";
        case Level::ERROR:   return "ERROR";
    }
    return "INFO";
}

static std::string local_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

ConsoleSink::ConsoleSink(std::ostream& out, Level min_level)
    : out_(out), min_level_(min_level) {}

std::string ConsoleSink::format_line(const std::string& timestamp, Level level,
                                     const std::string& event, const json& fields) {
    std::ostringstream line;
    line << timestamp << " | " << to_string(level) << " | " << event;
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            line << ' ' << it.key() << '=';
            if (it->is_string()) {
                line << it->get<std::string>();
            } else {
                line << it->dump(-1, ' ', false, json::error_handler_t::replace);
            }
        }
    }
    return line.str();
}

void ConsoleSink::log(Level level, const std::string& event, const json& fields) {
    if (static_cast<int>(level) < static_cast<int>(min_level_)) return;
    std::string line = format_line(local_timestamp(), level, event, fields);
    std::lock_guard<std::mutex> lock(mu_);
    out_ << line << "\n";
    out_.flush();
}

ChainSink::ChainSink(ChainLogger& chain) : chain_(chain) {}

void ChainSink::log(Level level, const std::string& event, const json& fields) {
    json payload = fields.is_object() ? fields : json::object();
    payload["level"] = to_string(level);
    std::string target = payload.value("input", "");
    if (!chain_.append(event, payload, target)) {
        dropped_++;
    }
}

void FanoutSink::add(std::shared_ptr<Sink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void FanoutSink::log(Level level, const std::string& event, const json& fields) {
    for (const auto& s : sinks_) {
        s->log(level, event, fields);
    }
}

} // namespace logging
