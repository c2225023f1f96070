#include "upnp/ssdp_prober.h"

#include "core/error_codes.h"
#include "logging/logger.h"
#include "net/http_client.h"
#include "upnp/descriptor_resolver.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace zonelink {
namespace upnp {

namespace {

constexpr int kPollTimeoutMs = 100;

std::string errnoMessage(const std::string& prefix) {
    return prefix + ": " + std::strerror(errno);
}

bool parseIpv4(const std::string& text, in_addr& out) {
    if (text.empty()) {
        out.s_addr = INADDR_ANY;
        return true;
    }
    return ::inet_pton(AF_INET, text.c_str(), &out) == 1;
}

}  // namespace

std::string buildSearchRequest(const SsdpConfig& config) {
    std::ostringstream oss;
    oss << "M-SEARCH * HTTP/1.1\r\n"
        << "HOST: " << config.multicastAddress << ":" << config.port << "\r\n"
        << "MAN: \"ssdp:discover\"\r\n"
        << "MX: " << config.mx << "\r\n"
        << "ST: " << config.searchTarget << "\r\n"
        << "USER-AGENT: " << DaemonConstants::USER_AGENT << "\r\n\r\n";
    return oss.str();
}

std::optional<SsdpResponse> parseSsdpResponse(std::string_view datagram,
                                              const std::string& searchTarget) {
    std::string startLine;
    net::HeaderList headers;
    if (!net::parseHeaderBlock(datagram, startLine, headers)) {
        return std::nullopt;
    }

    // "HTTP/1.1 200 OK"; multicast announcements never reach the search socket
    if (startLine.rfind("HTTP/", 0) != 0 || startLine.find(" 200") == std::string::npos) {
        return std::nullopt;
    }

    SsdpResponse response;
    response.searchTarget = net::findHeader(headers, "ST").value_or(std::string());
    if (!net::equalsIgnoreCase(response.searchTarget, searchTarget)) {
        return std::nullopt;
    }
    response.location = net::findHeader(headers, "LOCATION").value_or(std::string());
    if (response.location.empty() || !net::parseUrl(response.location)) {
        return std::nullopt;
    }
    response.usn = net::findHeader(headers, "USN").value_or(std::string());
    response.deviceId = normalizeDeviceId(response.usn);
    response.server = net::findHeader(headers, "SERVER").value_or(std::string());
    return response;
}

SsdpProber::SsdpProber(SsdpConfig config, ResponseHandler handler)
    : config_(std::move(config)), handler_(std::move(handler)) {}

SsdpProber::~SsdpProber() {
    stop();
}

void SsdpProber::start() {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        throw DiscoverySocketError(errnoMessage("SSDP socket"));
    }

    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    if (!parseIpv4(config_.bindAddress, addr.sin_addr)) {
        ::close(fd);
        throw DiscoverySocketError("Invalid SSDP bind address: " + config_.bindAddress);
    }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string msg = errnoMessage("SSDP bind");
        ::close(fd);
        throw DiscoverySocketError(msg);
    }

    unsigned char ttl = 4;
    ::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
    if (!config_.bindAddress.empty()) {
        if (::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &addr.sin_addr, sizeof(addr.sin_addr)) !=
            0) {
            std::string msg = errnoMessage("IP_MULTICAST_IF " + config_.bindAddress);
            ::close(fd);
            throw DiscoverySocketError(msg, ErrorCode::DISCOVERY_MULTICAST_JOIN_FAILED);
        }
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    localPort_ = ntohs(addr.sin_port);
    fd_ = fd;

    running_.store(true, std::memory_order_release);
    listener_ = std::thread([this]() { listenLoop(); });
    LOG_INFO("SSDP: listening on port {} for {}", localPort_, config_.searchTarget);
}

bool SsdpProber::search() {
    if (!running_.load(std::memory_order_acquire) || fd_ < 0) {
        return false;
    }

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(config_.port);
    if (::inet_pton(AF_INET, config_.multicastAddress.c_str(), &dest.sin_addr) != 1) {
        LOG_WARN("SSDP: invalid multicast address {}", config_.multicastAddress);
        return false;
    }

    const std::string request = buildSearchRequest(config_);
    ssize_t sent = ::sendto(fd_, request.data(), request.size(), 0,
                            reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0 || static_cast<size_t>(sent) != request.size()) {
        LOG_WARN("SSDP: M-SEARCH send failed: {}", std::strerror(errno));
        return false;
    }
    searchesSent_.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG("SSDP: M-SEARCH sent to {}:{}", config_.multicastAddress, config_.port);
    return true;
}

void SsdpProber::listenLoop() {
    std::vector<char> buffer(DaemonConstants::SSDP_MAX_DATAGRAM_BYTES);

    while (running_.load(std::memory_order_acquire)) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int pollResult = ::poll(&pfd, 1, kPollTimeoutMs);
        if (pollResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("SSDP: poll failed: {}", std::strerror(errno));
            break;
        }
        if (pollResult == 0 || (pfd.revents & POLLIN) == 0) {
            continue;
        }

        while (true) {
            sockaddr_in src{};
            socklen_t srcLen = sizeof(src);
            ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                   reinterpret_cast<sockaddr*>(&src), &srcLen);
            if (n < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_WARN("SSDP: recvfrom failed: {}", std::strerror(errno));
                }
                break;
            }

            auto response = parseSsdpResponse(
                std::string_view(buffer.data(), static_cast<size_t>(n)), config_.searchTarget);
            if (!response) {
                datagramsDropped_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            char ip[INET_ADDRSTRLEN] = {};
            ::inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));
            response->sourceAddress = ip;
            responsesAccepted_.fetch_add(1, std::memory_order_relaxed);

            if (!handler_) {
                continue;
            }
            try {
                handler_(*response);
            } catch (const std::exception& e) {
                LOG_ERROR("SSDP: response handler failed for {}: {}", response->location,
                          e.what());
            }
        }
    }
}

void SsdpProber::stop() {
    bool wasRunning = running_.exchange(false, std::memory_order_acq_rel);
    if (listener_.joinable()) {
        listener_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (wasRunning) {
        LOG_INFO("SSDP: stopped ({} searches, {} responses)", searchesSent(), responsesAccepted());
    }
}

}  // namespace upnp
}  // namespace zonelink
