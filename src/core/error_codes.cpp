#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace zonelink {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Discovery / SSDP
    {ErrorCode::DISCOVERY_SOCKET_ERROR, "DISCOVERY_SOCKET_ERROR"},
    {ErrorCode::DISCOVERY_MULTICAST_JOIN_FAILED, "DISCOVERY_MULTICAST_JOIN_FAILED"},
    {ErrorCode::DISCOVERY_SEND_FAILED, "DISCOVERY_SEND_FAILED"},
    {ErrorCode::DISCOVERY_INVALID_RESPONSE, "DISCOVERY_INVALID_RESPONSE"},

    // Device descriptor
    {ErrorCode::DESCRIPTOR_FETCH_FAILED, "DESCRIPTOR_FETCH_FAILED"},
    {ErrorCode::DESCRIPTOR_PARSE_FAILED, "DESCRIPTOR_PARSE_FAILED"},
    {ErrorCode::DESCRIPTOR_MISSING_FIELD, "DESCRIPTOR_MISSING_FIELD"},

    // IPC/ZeroMQ
    {ErrorCode::IPC_CONNECTION_FAILED, "IPC_CONNECTION_FAILED"},
    {ErrorCode::IPC_TIMEOUT, "IPC_TIMEOUT"},
    {ErrorCode::IPC_INVALID_COMMAND, "IPC_INVALID_COMMAND"},
    {ErrorCode::IPC_INVALID_PARAMS, "IPC_INVALID_PARAMS"},
    {ErrorCode::IPC_DAEMON_NOT_RUNNING, "IPC_DAEMON_NOT_RUNNING"},
    {ErrorCode::IPC_PROTOCOL_ERROR, "IPC_PROTOCOL_ERROR"},
    {ErrorCode::IPC_NOT_FOUND, "IPC_NOT_FOUND"},

    // Event subscription
    {ErrorCode::EVENT_SUBSCRIBE_FAILED, "EVENT_SUBSCRIBE_FAILED"},
    {ErrorCode::EVENT_RENEW_FAILED, "EVENT_RENEW_FAILED"},
    {ErrorCode::EVENT_LEASE_REJECTED, "EVENT_LEASE_REJECTED"},
    {ErrorCode::EVENT_LISTENER_FAILED, "EVENT_LISTENER_FAILED"},
    {ErrorCode::EVENT_UNKNOWN_SUBSCRIPTION, "EVENT_UNKNOWN_SUBSCRIPTION"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},
    {ErrorCode::VALIDATION_INVALID_URL, "VALIDATION_INVALID_URL"},

    // Topology / SOAP
    {ErrorCode::TOPOLOGY_PARSE_FAILED, "TOPOLOGY_PARSE_FAILED"},
    {ErrorCode::TOPOLOGY_SOAP_FAULT, "TOPOLOGY_SOAP_FAULT"},
    {ErrorCode::TOPOLOGY_QUEUE_FULL, "TOPOLOGY_QUEUE_FULL"},

    // HTTP transport
    {ErrorCode::HTTP_CONNECT_FAILED, "HTTP_CONNECT_FAILED"},
    {ErrorCode::HTTP_TIMEOUT, "HTTP_TIMEOUT"},
    {ErrorCode::HTTP_BAD_RESPONSE, "HTTP_BAD_RESPONSE"},
    {ErrorCode::HTTP_RESOLVE_FAILED, "HTTP_RESOLVE_FAILED"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

static const std::unordered_map<ErrorCode, int> kHttpStatusMap = {
    {ErrorCode::OK, 200},

    // Discovery / SSDP
    {ErrorCode::DISCOVERY_SOCKET_ERROR, 500},
    {ErrorCode::DISCOVERY_MULTICAST_JOIN_FAILED, 500},
    {ErrorCode::DISCOVERY_SEND_FAILED, 503},
    {ErrorCode::DISCOVERY_INVALID_RESPONSE, 502},

    // Device descriptor
    {ErrorCode::DESCRIPTOR_FETCH_FAILED, 502},
    {ErrorCode::DESCRIPTOR_PARSE_FAILED, 502},
    {ErrorCode::DESCRIPTOR_MISSING_FIELD, 502},

    // IPC/ZeroMQ
    {ErrorCode::IPC_CONNECTION_FAILED, 503},
    {ErrorCode::IPC_TIMEOUT, 504},
    {ErrorCode::IPC_INVALID_COMMAND, 400},
    {ErrorCode::IPC_INVALID_PARAMS, 400},
    {ErrorCode::IPC_DAEMON_NOT_RUNNING, 503},
    {ErrorCode::IPC_PROTOCOL_ERROR, 500},
    {ErrorCode::IPC_NOT_FOUND, 404},

    // Event subscription
    {ErrorCode::EVENT_SUBSCRIBE_FAILED, 502},
    {ErrorCode::EVENT_RENEW_FAILED, 502},
    {ErrorCode::EVENT_LEASE_REJECTED, 409},
    {ErrorCode::EVENT_LISTENER_FAILED, 500},
    {ErrorCode::EVENT_UNKNOWN_SUBSCRIPTION, 412},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, 400},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, 404},
    {ErrorCode::VALIDATION_INVALID_URL, 400},

    // Topology / SOAP
    {ErrorCode::TOPOLOGY_PARSE_FAILED, 502},
    {ErrorCode::TOPOLOGY_SOAP_FAULT, 502},
    {ErrorCode::TOPOLOGY_QUEUE_FULL, 503},

    // HTTP transport
    {ErrorCode::HTTP_CONNECT_FAILED, 503},
    {ErrorCode::HTTP_TIMEOUT, 504},
    {ErrorCode::HTTP_BAD_RESPONSE, 502},
    {ErrorCode::HTTP_RESOLVE_FAILED, 503},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, 500},
};

// Built from kErrorCodeStrings so the two tables cannot drift apart.
static const std::unordered_map<std::string, ErrorCode>& stringToCodeTable() {
    static const std::unordered_map<std::string, ErrorCode> table = []() {
        std::unordered_map<std::string, ErrorCode> reverse;
        for (const auto& [code, name] : kErrorCodeStrings) {
            reverse.emplace(name, code);
        }
        return reverse;
    }();
    return table;
}

InnerError::InnerError(ErrorCode code, const std::string& message)
    : cpp_code(errorCodeToHex(code)), cpp_message(message) {}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isDiscoveryError(code)) {
        return "discovery";
    }
    if (isDescriptorError(code)) {
        return "descriptor";
    }
    if (isIpcError(code)) {
        return "ipc_zeromq";
    }
    if (isEventError(code)) {
        return "event_subscription";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    if (isTopologyError(code)) {
        return "topology";
    }
    if (isHttpError(code)) {
        return "http";
    }
    return "internal";
}

int toHttpStatus(ErrorCode code) {
    auto it = kHttpStatusMap.find(code);
    if (it != kHttpStatusMap.end()) {
        return it->second;
    }
    return 500;
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    const auto& table = stringToCodeTable();
    auto it = table.find(str);
    if (it != table.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace zonelink
