/**
 * dockbox Wire Protocol
 *
 * Binary protocol for client <-> daemon communication.
 * Header: 17 bytes (magic + client_id + opcode + payload_size),
 * followed by a JSON payload.
 */
#pragma once
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <optional>

namespace dockbox::ipc {

// Magic bytes for protocol validation
constexpr uint32_t MAGIC_BYTES = 0x444B4258; // "DKBX" in hex
constexpr size_t HEADER_SIZE = 17;
constexpr size_t MAX_PAYLOAD_SIZE = 1024 * 1024; // 1MB max

// Daemon operations
enum class Opcode : uint8_t {
    NOOP             = 0x00,  // Echo, for liveness checks
    INIT_ENV         = 0x01,  // Provision a sandbox container
    GET_AUDIT_LOG    = 0x76,  // Get audit log entries
    SET_AUDIT_CONFIG = 0x77,  // Configure audit logging
    EXIT             = 0xFF   // Close the session
};

// Wire protocol header (17 bytes, packed)
struct __attribute__((packed)) MessageHeader {
    uint32_t magic;         // Must be MAGIC_BYTES
    uint32_t client_id;     // Assigned by the daemon per connection
    Opcode opcode;          // What operation to perform
    uint64_t payload_size;  // Bytes following this header
};

static_assert(sizeof(MessageHeader) == HEADER_SIZE, "Header size mismatch");

// Application-level message
struct Message {
    uint32_t client_id;
    Opcode opcode;
    std::vector<uint8_t> payload;

    Message() : client_id(0), opcode(Opcode::NOOP) {}

    Message(uint32_t id, Opcode op, const std::vector<uint8_t>& data = {})
        : client_id(id), opcode(op), payload(data) {}

    Message(uint32_t id, Opcode op, const std::string& data)
        : client_id(id), opcode(op), payload(data.begin(), data.end()) {}

    // Get payload as string
    std::string payload_str() const {
        return std::string(payload.begin(), payload.end());
    }

    // Serialize message to wire format
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buffer(HEADER_SIZE + payload.size());

        MessageHeader header;
        header.magic = MAGIC_BYTES;
        header.client_id = client_id;
        header.opcode = opcode;
        header.payload_size = payload.size();

        std::memcpy(buffer.data(), &header, HEADER_SIZE);
        if (!payload.empty()) {
            std::memcpy(buffer.data() + HEADER_SIZE, payload.data(), payload.size());
        }

        return buffer;
    }

    // Deserialize message from wire format
    static std::optional<Message> deserialize(const uint8_t* data, size_t len) {
        auto total = get_message_size(data, len);
        if (!total || len < *total) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        Message msg;
        msg.client_id = header.client_id;
        msg.opcode = header.opcode;

        if (header.payload_size > 0) {
            msg.payload.resize(header.payload_size);
            std::memcpy(msg.payload.data(), data + HEADER_SIZE, header.payload_size);
        }

        return msg;
    }

    // Total message size announced by a header, nullopt if the header is
    // incomplete or invalid
    static std::optional<size_t> get_message_size(const uint8_t* data, size_t len) {
        if (len < HEADER_SIZE) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        if (header.magic != MAGIC_BYTES) {
            return std::nullopt;
        }

        if (header.payload_size > MAX_PAYLOAD_SIZE) {
            return std::nullopt;
        }

        return HEADER_SIZE + header.payload_size;
    }
};

// Convert opcode to string for logging
inline const char* opcode_to_string(Opcode op) {
    switch (op) {
        case Opcode::NOOP:             return "NOOP";
        case Opcode::INIT_ENV:         return "INIT_ENV";
        case Opcode::GET_AUDIT_LOG:    return "GET_AUDIT_LOG";
        case Opcode::SET_AUDIT_CONFIG: return "SET_AUDIT_CONFIG";
        case Opcode::EXIT:             return "EXIT";
        default: return "UNKNOWN";
    }
}

} // namespace dockbox::ipc
