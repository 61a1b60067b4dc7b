/**
 * @file chain.cpp
 * @brief Hash-chained JSONL audit log for detection runs
 */

#include "chain.h"
#include <openssl/sha.h>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace logging {

using json = nlohmann::json;

// Keys are kept sorted by nlohmann::json, so the compact form is canonical.
// Invalid UTF-8 is replaced here, which makes the hashed bytes exactly the
// bytes that end up in the file.
static std::string serialise(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    long ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03ldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

json LogEntry::to_json() const {
    json j;
    j["event_type"] = event_type;
    j["run_id"] = run_id;
    j["timestamp"] = timestamp;
    j["prev_hash"] = prev_hash;
    j["entry_hash"] = entry_hash;
    j["payload"] = payload;
    if (!target.empty()) {
        j["target"] = target;
    }
    return j;
}

LogEntry LogEntry::from_json(const json& j) {
    LogEntry entry;
    entry.event_type = j.value("event_type", "");
    entry.run_id = j.value("run_id", "");
    entry.target = j.value("target", "");
    entry.timestamp = j.value("timestamp", "");
    entry.prev_hash = j.value("prev_hash", "");
    entry.entry_hash = j.value("entry_hash", "");
    entry.payload = j.value("payload", json::object());
    return entry;
}

// SHA-256 over the entry as it is written, with entry_hash left blank
std::string ChainLogger::compute_hash(const LogEntry& entry) {
    json unsigned_form = entry.to_json();
    unsigned_form["entry_hash"] = "";
    std::string data = serialise(unsigned_form);

    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    static const char* const hex = "0123456789abcdef";
    std::string out = "sha256:";
    for (unsigned char b : digest) {
        out += hex[b >> 4];
        out += hex[b & 0x0f];
    }
    return out;
}

ChainLogger::ChainLogger(const std::string& log_path, const std::string& run_id)
    : run_id_(run_id) {
    auto existing = load(log_path);
    last_hash_ = existing.empty() ? kGenesisHash : existing.back().entry_hash;
    out_.open(log_path, std::ios::app);
}

std::string ChainLogger::last_hash() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_hash_;
}

bool ChainLogger::append(const std::string& event_type, const json& payload,
                         const std::string& target) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!out_.is_open()) return false;

    LogEntry entry;
    entry.event_type = event_type;
    entry.run_id = run_id_;
    entry.target = target;
    entry.timestamp = utc_timestamp();
    entry.prev_hash = last_hash_;
    entry.payload = payload;
    entry.entry_hash = compute_hash(entry);

    out_ << serialise(entry.to_json()) << "\n";
    out_.flush();
    if (!out_.good()) return false;

    last_hash_ = entry.entry_hash;
    return true;
}

std::vector<LogEntry> ChainLogger::load(const std::string& log_path, std::string* problem) {
    std::vector<LogEntry> entries;
    std::ifstream in(log_path);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty()) continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            if (problem) *problem = "line " + std::to_string(line_no) + " is not a JSON object";
            break;
        }
        entries.push_back(LogEntry::from_json(j));
    }
    return entries;
}

bool ChainLogger::verify(const std::string& log_path, std::string* problem) {
    std::string parse_problem;
    auto entries = load(log_path, &parse_problem);
    if (!parse_problem.empty()) {
        if (problem) *problem = parse_problem;
        return false;
    }

    std::string expected_prev = kGenesisHash;
    for (size_t i = 0; i < entries.size(); i++) {
        const auto& entry = entries[i];
        if (entry.prev_hash != expected_prev) {
            if (problem) *problem = "entry " + std::to_string(i) + " (" + entry.event_type +
                                    ") does not link to the entry before it";
            return false;
        }
        if (compute_hash(entry) != entry.entry_hash) {
            if (problem) *problem = "entry " + std::to_string(i) + " (" + entry.event_type +
                                    ") was modified after it was written";
            return false;
        }
        expected_prev = entry.entry_hash;
    }
    return true;
}

} // namespace logging
