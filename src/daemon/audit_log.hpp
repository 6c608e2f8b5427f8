/**
 * dockbox Audit Log
 *
 * Bounded in-memory record of provisioning activity: engine connections,
 * image checks and pulls, container creation and start, and inbound
 * requests. Queryable over the wire.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "provision/types.hpp"

namespace dockbox::daemon {

enum class AuditCategory {
    ENGINE,      // Connection resolution
    IMAGE,       // Inspect and pull
    CONTAINER,   // Create and start
    REQUEST      // Inbound operations
};

inline std::string audit_category_to_string(AuditCategory cat) {
    switch (cat) {
        case AuditCategory::ENGINE:    return "ENGINE";
        case AuditCategory::IMAGE:     return "IMAGE";
        case AuditCategory::CONTAINER: return "CONTAINER";
        case AuditCategory::REQUEST:   return "REQUEST";
        default: return "UNKNOWN";
    }
}

inline std::optional<AuditCategory> audit_category_from_string(const std::string& str) {
    if (str == "ENGINE")    return AuditCategory::ENGINE;
    if (str == "IMAGE")     return AuditCategory::IMAGE;
    if (str == "CONTAINER") return AuditCategory::CONTAINER;
    if (str == "REQUEST")   return AuditCategory::REQUEST;
    return std::nullopt;
}

// Category a provisioning state transition is filed under
AuditCategory audit_category_for_state(provision::ProvisionState state);

struct AuditLogEntry {
    uint64_t id;
    std::chrono::system_clock::time_point timestamp;
    AuditCategory category;
    std::string event_type;       // e.g. "PULLING", "INIT_ENV"
    uint32_t client_id;           // 0 = daemon
    nlohmann::json details;
    bool success;

    nlohmann::json to_json() const;
};

struct AuditConfig {
    size_t max_entries = 10000;
    bool log_engine = true;
    bool log_image = true;
    bool log_container = true;
    bool log_requests = true;

    bool is_enabled(AuditCategory cat) const;
};

class AuditLogger {
public:
    AuditLogger();
    explicit AuditLogger(const AuditConfig& config);

    void log(AuditCategory category,
             const std::string& event_type,
             uint32_t client_id,
             const nlohmann::json& details,
             bool success = true);

    // Record one provisioning state transition
    void log_transition(uint32_t client_id, const std::string& image,
                        provision::ProvisionState state);

    // Most recent matching entries after `since_id`, oldest first
    std::vector<AuditLogEntry> get_entries(std::optional<AuditCategory> category = std::nullopt,
                                           std::optional<uint32_t> client_id = std::nullopt,
                                           uint64_t since_id = 0,
                                           size_t limit = 100) const;

    void set_config(const AuditConfig& config);
    AuditConfig get_config() const;

    void clear();
    size_t entry_count() const;
    uint64_t last_entry_id() const;

private:
    AuditConfig config_;
    std::deque<AuditLogEntry> entries_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;

    void trim_entries();
};

} // namespace dockbox::daemon
