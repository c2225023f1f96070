#ifndef ZONELINK_ERROR_CODES_H
#define ZONELINK_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace zonelink {

/**
 * @brief Error codes for the zonelink discovery daemon.
 *
 * Categories use the upper nibble (0xF000 mask):
 * - 0x1xxx: Discovery / SSDP
 * - 0x2xxx: Device descriptor
 * - 0x3xxx: IPC / ZeroMQ
 * - 0x4xxx: Event subscription (GENA)
 * - 0x5xxx: Validation / configuration
 * - 0x6xxx: Topology / SOAP
 * - 0x7xxx: HTTP transport
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Discovery / SSDP (0x1000)
    DISCOVERY_SOCKET_ERROR = 0x1001,
    DISCOVERY_MULTICAST_JOIN_FAILED = 0x1002,
    DISCOVERY_SEND_FAILED = 0x1003,
    DISCOVERY_INVALID_RESPONSE = 0x1004,

    // Device descriptor (0x2000)
    DESCRIPTOR_FETCH_FAILED = 0x2001,
    DESCRIPTOR_PARSE_FAILED = 0x2002,
    DESCRIPTOR_MISSING_FIELD = 0x2003,

    // IPC/ZeroMQ (0x3000)
    IPC_CONNECTION_FAILED = 0x3001,
    IPC_TIMEOUT = 0x3002,
    IPC_INVALID_COMMAND = 0x3003,
    IPC_INVALID_PARAMS = 0x3004,
    IPC_DAEMON_NOT_RUNNING = 0x3005,
    IPC_PROTOCOL_ERROR = 0x3006,
    IPC_NOT_FOUND = 0x3007,

    // Event subscription (0x4000)
    EVENT_SUBSCRIBE_FAILED = 0x4001,
    EVENT_RENEW_FAILED = 0x4002,
    EVENT_LEASE_REJECTED = 0x4003,
    EVENT_LISTENER_FAILED = 0x4004,
    EVENT_UNKNOWN_SUBSCRIPTION = 0x4005,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_FILE_NOT_FOUND = 0x5002,
    VALIDATION_INVALID_URL = 0x5003,

    // Topology / SOAP (0x6000)
    TOPOLOGY_PARSE_FAILED = 0x6001,
    TOPOLOGY_SOAP_FAULT = 0x6002,
    TOPOLOGY_QUEUE_FULL = 0x6003,

    // HTTP transport (0x7000)
    HTTP_CONNECT_FAILED = 0x7001,
    HTTP_TIMEOUT = 0x7002,
    HTTP_BAD_RESPONSE = 0x7003,
    HTTP_RESOLVE_FAILED = 0x7004,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Lower-layer detail attached to a failure report (status JSON, PUB events).
 */
struct InnerError {
    std::string cpp_code;             // hex string, e.g. "0x4002"
    std::string cpp_message;          // human readable detail
    std::optional<int> sys_errno;     // errno of the failed socket call
    std::optional<int> http_status;   // HTTP status returned by the device
    std::optional<std::string> peer;  // device URL or address involved

    InnerError() = default;
    InnerError(ErrorCode code, const std::string& message);
};

/**
 * @brief Convert ErrorCode to its enumerator name, or "UNKNOWN_ERROR".
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name ("discovery", "descriptor", ...), "internal" for unknown codes.
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief HTTP status a consumer-facing API would report for this code (500 if unmapped).
 */
int toHttpStatus(ErrorCode code);

std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Reverse of errorCodeToString; INTERNAL_UNKNOWN when not found.
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isDiscoveryError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isDescriptorError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isEventError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isTopologyError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x6000;
}
constexpr bool isHttpError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x7000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Whether the failed operation is expected to succeed on a later attempt.
 *
 * Per-device network failures are retryable (next SSDP cycle or next renewal
 * tick); parse failures and a failed socket bind are not.
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::DESCRIPTOR_FETCH_FAILED ||
           code == ErrorCode::EVENT_SUBSCRIBE_FAILED || code == ErrorCode::EVENT_RENEW_FAILED ||
           code == ErrorCode::EVENT_LEASE_REJECTED || code == ErrorCode::HTTP_CONNECT_FAILED ||
           code == ErrorCode::HTTP_TIMEOUT || code == ErrorCode::IPC_TIMEOUT ||
           code == ErrorCode::IPC_CONNECTION_FAILED || code == ErrorCode::IPC_DAEMON_NOT_RUNNING;
}

// ========== Exceptions ==========

/**
 * @brief Base of every zonelink exception; carries the ErrorCode it maps to.
 */
class Error : public std::runtime_error {
   public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    InnerError toInnerError() const {
        return InnerError(code_, what());
    }

   private:
    ErrorCode code_;
};

// Multicast socket could not be created or bound. Fatal to discovery start.
class DiscoverySocketError : public Error {
   public:
    explicit DiscoverySocketError(const std::string& message,
                                  ErrorCode code = ErrorCode::DISCOVERY_SOCKET_ERROR)
        : Error(code, message) {}
};

class DescriptorFetchError : public Error {
   public:
    explicit DescriptorFetchError(const std::string& message)
        : Error(ErrorCode::DESCRIPTOR_FETCH_FAILED, message) {}
};

class DescriptorParseError : public Error {
   public:
    explicit DescriptorParseError(const std::string& message,
                                  ErrorCode code = ErrorCode::DESCRIPTOR_PARSE_FAILED)
        : Error(code, message) {}
};

class SubscribeError : public Error {
   public:
    explicit SubscribeError(const std::string& message, int httpStatus = 0)
        : Error(ErrorCode::EVENT_SUBSCRIBE_FAILED, message), httpStatus_(httpStatus) {}

    int httpStatus() const noexcept {
        return httpStatus_;
    }

   private:
    int httpStatus_;
};

class RenewError : public Error {
   public:
    explicit RenewError(const std::string& message, int httpStatus = 0)
        : Error(httpStatus == 412 ? ErrorCode::EVENT_LEASE_REJECTED
                                  : ErrorCode::EVENT_RENEW_FAILED,
                message),
          httpStatus_(httpStatus) {}

    int httpStatus() const noexcept {
        return httpStatus_;
    }

    // The device no longer knows the SID; only a fresh SUBSCRIBE can recover.
    bool leaseRejected() const noexcept {
        return httpStatus_ == 412;
    }

   private:
    int httpStatus_;
};

class TopologyParseError : public Error {
   public:
    explicit TopologyParseError(const std::string& message)
        : Error(ErrorCode::TOPOLOGY_PARSE_FAILED, message) {}
};

class HttpError : public Error {
   public:
    HttpError(ErrorCode code, const std::string& message) : Error(code, message) {}
};

class SoapFaultError : public Error {
   public:
    SoapFaultError(std::string faultCode, std::string faultString, int upnpErrorCode)
        : Error(ErrorCode::TOPOLOGY_SOAP_FAULT,
                "SOAP fault " + faultCode + ": " + faultString +
                    (upnpErrorCode != 0 ? " (UPnP error " + std::to_string(upnpErrorCode) + ")"
                                        : std::string())),
          faultCode_(std::move(faultCode)),
          faultString_(std::move(faultString)),
          upnpErrorCode_(upnpErrorCode) {}

    const std::string& faultCode() const noexcept {
        return faultCode_;
    }
    const std::string& faultString() const noexcept {
        return faultString_;
    }
    int upnpErrorCode() const noexcept {
        return upnpErrorCode_;
    }

   private:
    std::string faultCode_;
    std::string faultString_;
    int upnpErrorCode_;
};

}  // namespace zonelink

#endif  // ZONELINK_ERROR_CODES_H
