#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>
#include <fstream>

namespace logging {

// Append-only audit log for detection runs, one JSON object per line.
// Each entry carries the hash of the previous entry, so deleting or editing
// a recorded probe or verdict breaks the chain and shows up in verify().

struct LogEntry {
    std::string event_type;
    std::string target;        // Raw input the detection run was started with
    std::string run_id;
    nlohmann::json payload;
    std::string prev_hash;
    std::string entry_hash;
    std::string timestamp;

    nlohmann::json to_json() const;
    static LogEntry from_json(const nlohmann::json& j);
};

class ChainLogger {
public:
    static constexpr const char* kGenesisHash = "sha256:genesis";

    /**
     * @brief Open (or continue) an audit log
     * @param log_path Path to the log file (created if needed)
     * @param run_id Identifier stamped on every entry written by this logger
     */
    ChainLogger(const std::string& log_path, const std::string& run_id);

    /**
     * @brief Append an entry linked to the previous one
     * @param event_type What happened (e.g. "probe_issued", "decision")
     * @param payload Event fields
     * @param target Input string of the detection run, may be empty
     * @return false if the entry could not be written
     *
     * Safe to call from several detection runs at once. Text that is not
     * valid UTF-8 is stored with U+FFFD in its place, and hashed that way.
     */
    bool append(const std::string& event_type, const nlohmann::json& payload,
                const std::string& target = "");

    std::string last_hash() const;

    /**
     * @brief Check that every entry hashes to its recorded value and links to its predecessor
     * @param problem If given, receives a description of the first broken entry
     */
    static bool verify(const std::string& log_path, std::string* problem = nullptr);

    // Entries up to the first unparsable line; that line is reported through problem
    static std::vector<LogEntry> load(const std::string& log_path, std::string* problem = nullptr);

private:
    static std::string compute_hash(const LogEntry& entry);

    std::string run_id_;
    std::string last_hash_;
    std::ofstream out_;
    mutable std::mutex mu_;
};

} // namespace logging
