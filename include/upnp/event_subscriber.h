#ifndef ZONELINK_UPNP_EVENT_SUBSCRIBER_H
#define ZONELINK_UPNP_EVENT_SUBSCRIBER_H

#include "core/daemon_constants.h"
#include "net/http_client.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace zonelink {
namespace upnp {

struct EventSubscriberConfig {
    std::string callbackHost;   // empty = interface on the device's subnet
    std::string listenAddress;  // empty = INADDR_ANY
    uint16_t callbackPort = 0;  // 0 = ephemeral
    int requestedTimeoutSec = DaemonConstants::DEFAULT_SUBSCRIPTION_TIMEOUT_SEC;
    int httpTimeoutMs = DaemonConstants::DEFAULT_HTTP_TIMEOUT_MS;
    int retryIntervalSec = DaemonConstants::DEFAULT_SUBSCRIBE_RETRY_SEC;  // backoff cap, no lease held
    size_t workerThreads = DaemonConstants::DEFAULT_GENA_WORKERS;  // per listener and renewer
    bool unsubscribeOnStop = false;
};

/**
 * @brief One GENA lease, keyed by (deviceId, service).
 *
 * An empty sid means no lease is held yet: the SUBSCRIBE failed and is retried
 * at renewAt.
 */
struct Subscription {
    std::string deviceId;
    std::string service;  // "ZoneGroupTopology", "MediaRenderer/AVTransport"
    std::string baseUrl;
    std::string eventUrl;
    std::string callbackUrl;
    std::string sid;
    int grantedTimeoutSec = 0;
    std::chrono::steady_clock::time_point subscribedAt;
    std::chrono::steady_clock::time_point expiresAt;
    std::chrono::steady_clock::time_point renewAt;
    uint64_t renewals = 0;
    uint64_t consecutiveFailures = 0;
    bool needsResubscribe = false;  // no lease, or the device answered 412 to a renewal
};

/**
 * @brief GENA subscribe/renew client plus the NOTIFY callback listener.
 *
 * start() must be called before subscribe() so that the initial event a
 * device sends right after SUBSCRIBE is never lost. Renewals and inbound
 * connections are each served by workerThreads threads, so one unreachable
 * device holds up a single worker only. The handler must return quickly.
 */
class EventSubscriber {
   public:
    using NotificationHandler = std::function<void(const std::string& deviceId,
                                                   const std::string& service, std::string body)>;

    EventSubscriber(net::HttpTransport& transport, EventSubscriberConfig config,
                    NotificationHandler handler);
    ~EventSubscriber();

    EventSubscriber(const EventSubscriber&) = delete;
    EventSubscriber& operator=(const EventSubscriber&) = delete;

    /**
     * @brief Bind the callback listener and start the listener and renewal threads.
     *
     * @throws DiscoverySocketError (EVENT_LISTENER_FAILED) if the port cannot be bound
     */
    void start();

    /**
     * @brief Subscribe to <baseUrl>/<service>/Event on behalf of deviceId.
     *
     * An existing subscription for the same key and baseUrl is returned without
     * a request. A device that moved to another baseUrl gets a fresh SUBSCRIBE.
     *
     * @throws SubscribeError on transport failure, non-2xx status or a missing SID.
     *         The subscription is kept without a lease and retried with a
     *         backoff capped at retryIntervalSec.
     */
    Subscription subscribe(const std::string& baseUrl, const std::string& service,
                           const std::string& deviceId);

    /**
     * @brief Renew one subscription now (fresh SUBSCRIBE after a 412).
     *
     * @throws RenewError if the device could not be reached or rejected the lease
     */
    void renew(const std::string& deviceId, const std::string& service);

    // Cancels renewals and closes the listener. Devices are not unsubscribed
    // unless unsubscribeOnStop is set; leases expire on their own.
    void stop();

    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

    std::optional<Subscription> find(const std::string& deviceId,
                                     const std::string& service) const;
    // Subscriptions currently holding a lease.
    size_t subscriptionCount() const;
    nlohmann::json describe() const;

    uint16_t listenPort() const {
        return listenPort_;
    }
    std::string callbackUrlFor(const std::string& baseUrl, const std::string& deviceId,
                               const std::string& service) const;

    /**
     * @brief Route one inbound request to the handler.
     *
     * @return HTTP status to answer with: 200 routed, 412 unknown subscription,
     *         405 not a NOTIFY
     */
    int handleNotify(const std::string& method, const std::string& path,
                     const net::HeaderList& headers, std::string body);

    uint64_t notificationsRouted() const {
        return notificationsRouted_.load(std::memory_order_relaxed);
    }
    uint64_t notificationsRejected() const {
        return notificationsRejected_.load(std::memory_order_relaxed);
    }

    // granted/2 with a floor of one second.
    static int renewalDelaySec(int grantedTimeoutSec);

    // 1, 2, 4, ... seconds after consecutive failed SUBSCRIBEs, capped at capSec.
    static int retryDelaySec(uint64_t failures, int capSec);

    // "Second-1800" -> 1800; "infinite", missing or malformed -> fallback.
    static int parseTimeoutHeader(const std::string& value, int fallback);

   private:
    using Key = std::pair<std::string, std::string>;

    void listenLoop();
    void serveConnection(int fd);
    void renewalLoop();

    // Network part of subscribe/renew; no lock held.
    Subscription performSubscribe(Subscription sub);
    Subscription performRenew(Subscription sub);
    void scheduleLocked(Subscription& sub, int delaySec);

    net::HttpTransport& transport_;
    EventSubscriberConfig config_;
    NotificationHandler handler_;

    mutable std::mutex mutex_;
    std::condition_variable renewCv_;
    std::map<Key, Subscription> subscriptions_;
    std::map<std::string, Key> keyBySid_;
    std::set<Key> pending_;
    std::set<Key> renewing_;

    int listenFd_ = -1;
    uint16_t listenPort_ = 0;
    std::atomic<bool> running_{false};
    std::vector<std::thread> listeners_;
    std::vector<std::thread> renewers_;

    std::atomic<uint64_t> notificationsRouted_{0};
    std::atomic<uint64_t> notificationsRejected_{0};
};

}  // namespace upnp
}  // namespace zonelink

#endif  // ZONELINK_UPNP_EVENT_SUBSCRIBER_H
