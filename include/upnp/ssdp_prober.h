#ifndef ZONELINK_UPNP_SSDP_PROBER_H
#define ZONELINK_UPNP_SSDP_PROBER_H

#include "core/daemon_constants.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace zonelink {
namespace upnp {

struct SsdpConfig {
    std::string searchTarget = DaemonConstants::ZONE_PLAYER_URN;
    std::string multicastAddress = DaemonConstants::SSDP_MULTICAST_ADDRESS;
    uint16_t port = DaemonConstants::SSDP_PORT;
    int mx = DaemonConstants::SSDP_MX_SECONDS;
    std::string bindAddress;  // empty = INADDR_ANY
};

/**
 * @brief Fields of an SSDP search response that matched the search target.
 */
struct SsdpResponse {
    std::string location;
    std::string searchTarget;  // ST
    std::string usn;
    std::string deviceId;  // from USN, normalized; may be empty
    std::string server;
    std::string sourceAddress;
};

std::string buildSearchRequest(const SsdpConfig& config);

/**
 * @brief Parse a datagram; nullopt unless it is a 200 response for
 *        searchTarget carrying a LOCATION.
 */
std::optional<SsdpResponse> parseSsdpResponse(std::string_view datagram,
                                              const std::string& searchTarget);

/**
 * @brief Sends M-SEARCH requests and listens for unicast responses.
 *
 * Responses arrive on the socket the search was sent from; the listener
 * thread hands every matching one to the handler. Malformed or non-matching
 * datagrams are dropped.
 */
class SsdpProber {
   public:
    using ResponseHandler = std::function<void(const SsdpResponse&)>;

    SsdpProber(SsdpConfig config, ResponseHandler handler);
    ~SsdpProber();

    SsdpProber(const SsdpProber&) = delete;
    SsdpProber& operator=(const SsdpProber&) = delete;

    /**
     * @brief Bind the discovery socket and start the listener thread.
     *
     * @throws DiscoverySocketError if the socket cannot be created or bound
     */
    void start();

    // Send one M-SEARCH. Best-effort: false (and a warning) when sending fails.
    bool search();

    void stop();

    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

    uint16_t localPort() const {
        return localPort_;
    }
    uint64_t searchesSent() const {
        return searchesSent_.load(std::memory_order_relaxed);
    }
    uint64_t responsesAccepted() const {
        return responsesAccepted_.load(std::memory_order_relaxed);
    }
    uint64_t datagramsDropped() const {
        return datagramsDropped_.load(std::memory_order_relaxed);
    }

   private:
    void listenLoop();

    SsdpConfig config_;
    ResponseHandler handler_;
    int fd_ = -1;
    uint16_t localPort_ = 0;
    std::atomic<bool> running_{false};
    std::thread listener_;
    std::atomic<uint64_t> searchesSent_{0};
    std::atomic<uint64_t> responsesAccepted_{0};
    std::atomic<uint64_t> datagramsDropped_{0};
};

}  // namespace upnp
}  // namespace zonelink

#endif  // ZONELINK_UPNP_SSDP_PROBER_H
