#include "daemon/audit_log.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dockbox::daemon {

using json = nlohmann::json;
using provision::ProvisionState;

AuditCategory audit_category_for_state(ProvisionState state) {
    switch (state) {
        case ProvisionState::INIT:
        case ProvisionState::CONNECTING:
        case ProvisionState::CONNECTED:
        case ProvisionState::CONN_FAILED:
            return AuditCategory::ENGINE;
        case ProvisionState::CHECKING_IMAGE:
        case ProvisionState::PRESENT:
        case ProvisionState::PULLING:
        case ProvisionState::PULLED:
        case ProvisionState::PULL_FAILED:
            return AuditCategory::IMAGE;
        default:
            return AuditCategory::CONTAINER;
    }
}

// ============================================================================
// AuditLogEntry Implementation
// ============================================================================

json AuditLogEntry::to_json() const {
    json j;
    j["id"] = id;

    // ISO 8601, UTC, millisecond precision
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    j["timestamp"] = oss.str();

    j["category"] = audit_category_to_string(category);
    j["event_type"] = event_type;
    j["client_id"] = client_id;
    j["success"] = success;
    j["details"] = details;
    return j;
}

bool AuditConfig::is_enabled(AuditCategory cat) const {
    switch (cat) {
        case AuditCategory::ENGINE:    return log_engine;
        case AuditCategory::IMAGE:     return log_image;
        case AuditCategory::CONTAINER: return log_container;
        case AuditCategory::REQUEST:   return log_requests;
        default: return false;
    }
}

// ============================================================================
// AuditLogger Implementation
// ============================================================================

AuditLogger::AuditLogger() : config_() {}

AuditLogger::AuditLogger(const AuditConfig& config) : config_(config) {
    spdlog::debug("AuditLogger initialized (max_entries={})", config_.max_entries);
}

void AuditLogger::log(AuditCategory category,
                      const std::string& event_type,
                      uint32_t client_id,
                      const json& details,
                      bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.is_enabled(category)) {
        return;
    }

    AuditLogEntry entry;
    entry.id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.category = category;
    entry.event_type = event_type;
    entry.client_id = client_id;
    entry.details = details;
    entry.success = success;

    entries_.push_back(std::move(entry));
    trim_entries();

    spdlog::trace("Audit[{}]: {} client_id={} success={}",
        audit_category_to_string(category), event_type, client_id, success);
}

void AuditLogger::log_transition(uint32_t client_id, const std::string& image,
                                 ProvisionState state) {
    json details;
    details["image"] = image;

    bool failed = state == ProvisionState::CONN_FAILED ||
                  state == ProvisionState::PULL_FAILED ||
                  state == ProvisionState::CREATE_FAILED ||
                  state == ProvisionState::START_FAILED;
    log(audit_category_for_state(state), provision::provision_state_to_string(state),
        client_id, details, !failed);
}

std::vector<AuditLogEntry> AuditLogger::get_entries(std::optional<AuditCategory> category,
                                                    std::optional<uint32_t> client_id,
                                                    uint64_t since_id,
                                                    size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogEntry> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        const auto& entry = *it;
        if (entry.id <= since_id) {
            break;
        }
        if (category && entry.category != *category) {
            continue;
        }
        if (client_id && entry.client_id != *client_id) {
            continue;
        }
        result.push_back(entry);
    }

    std::reverse(result.begin(), result.end());
    return result;
}

void AuditLogger::set_config(const AuditConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    trim_entries();
    spdlog::debug("AuditLogger config updated (max_entries={})", config_.max_entries);
}

AuditConfig AuditLogger::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void AuditLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t AuditLogger::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t AuditLogger::last_entry_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

void AuditLogger::trim_entries() {
    // Caller holds the mutex
    while (entries_.size() > config_.max_entries) {
        entries_.pop_front();
    }
}

} // namespace dockbox::daemon
