#include "upnp/event_subscriber.h"

#include "core/error_codes.h"
#include "logging/logger.h"
#include "net/network_utils.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace zonelink {
namespace upnp {

namespace {

constexpr int kPollTimeoutMs = 100;
constexpr int kNotifyReadTimeoutMs = 2000;
constexpr int kListenBacklog = 16;

std::string errnoMessage(const std::string& prefix) {
    return prefix + ": " + std::strerror(errno);
}

const char* reasonPhrase(int status) {
    switch (status) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 405:
        return "Method Not Allowed";
    case 412:
        return "Precondition Failed";
    default:
        return "Error";
    }
}

std::string keyToString(const std::string& deviceId, const std::string& service) {
    return deviceId + "/" + service;
}

}  // namespace

EventSubscriber::EventSubscriber(net::HttpTransport& transport, EventSubscriberConfig config,
                                 NotificationHandler handler)
    : transport_(transport), config_(std::move(config)), handler_(std::move(handler)) {}

EventSubscriber::~EventSubscriber() {
    stop();
}

int EventSubscriber::renewalDelaySec(int grantedTimeoutSec) {
    return std::max(DaemonConstants::MIN_RENEWAL_DELAY_SEC, grantedTimeoutSec / 2);
}

int EventSubscriber::retryDelaySec(uint64_t failures, int capSec) {
    const int cap = std::max(DaemonConstants::MIN_RENEWAL_DELAY_SEC, capSec);
    int delay = DaemonConstants::MIN_RENEWAL_DELAY_SEC;
    for (uint64_t i = 1; i < failures && delay < cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap);
}

int EventSubscriber::parseTimeoutHeader(const std::string& value, int fallback) {
    std::string text = net::trimWhitespace(value);
    const std::string prefix = "second-";
    if (text.size() <= prefix.size() ||
        !net::equalsIgnoreCase(text.substr(0, prefix.size()), prefix)) {
        return fallback;
    }
    std::string digits = text.substr(prefix.size());
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return fallback;  // "Second-infinite"
    }
    try {
        int seconds = std::stoi(digits);
        return seconds > 0 ? seconds : fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

void EventSubscriber::start() {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw DiscoverySocketError(errnoMessage("GENA listener socket"),
                                   ErrorCode::EVENT_LISTENER_FAILED);
    }
    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.callbackPort);
    if (config_.listenAddress.empty()) {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, config_.listenAddress.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        throw DiscoverySocketError("Invalid GENA listen address: " + config_.listenAddress,
                                   ErrorCode::EVENT_LISTENER_FAILED);
    }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(fd, kListenBacklog) < 0) {
        std::string msg = errnoMessage("GENA listener bind port " +
                                       std::to_string(config_.callbackPort));
        ::close(fd);
        throw DiscoverySocketError(msg, ErrorCode::EVENT_LISTENER_FAILED);
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    listenPort_ = ntohs(addr.sin_port);
    listenFd_ = fd;

    running_.store(true, std::memory_order_release);
    const size_t workers = std::max<size_t>(1, config_.workerThreads);
    for (size_t i = 0; i < workers; ++i) {
        listeners_.emplace_back([this]() { listenLoop(); });
        renewers_.emplace_back([this]() { renewalLoop(); });
    }
    LOG_INFO("GENA: callback listener on port {} ({} workers)", listenPort_, workers);
}

std::string EventSubscriber::callbackUrlFor(const std::string& baseUrl,
                                            const std::string& deviceId,
                                            const std::string& service) const {
    std::string host = config_.callbackHost;
    if (host.empty()) {
        auto url = net::parseUrl(baseUrl);
        host = net::selectLocalAddress(url ? url->host : std::string());
    }
    return "http://" + host + ":" + std::to_string(listenPort_) +
           DaemonConstants::NOTIFY_PATH_PREFIX + deviceId + "/" + service;
}

void EventSubscriber::scheduleLocked(Subscription& sub, int delaySec) {
    sub.renewAt = std::chrono::steady_clock::now() + std::chrono::seconds(delaySec);
    renewCv_.notify_all();
}

Subscription EventSubscriber::subscribe(const std::string& baseUrl, const std::string& service,
                                        const std::string& deviceId) {
    Key key{deviceId, service};
    std::string previousSid;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        renewCv_.wait(lock, [&]() { return pending_.count(key) == 0; });
        auto it = subscriptions_.find(key);
        if (it != subscriptions_.end()) {
            if (it->second.baseUrl == baseUrl) {
                return it->second;
            }
            // The old lease lives on an address the device no longer answers on
            LOG_INFO("GENA: {} moved from {} to {}, resubscribing",
                     keyToString(deviceId, service), it->second.baseUrl, baseUrl);
            previousSid = it->second.sid;
        }
        // NOTIFYs that arrive before the SID is known are routed by path.
        pending_.insert(key);
    }

    Subscription sub;
    sub.deviceId = deviceId;
    sub.service = service;
    sub.baseUrl = baseUrl;
    sub.eventUrl = baseUrl + "/" + service + "/Event";
    sub.callbackUrl = callbackUrlFor(baseUrl, deviceId, service);

    Subscription granted;
    try {
        granted = performSubscribe(sub);
    } catch (const SubscribeError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(key);
        if (!previousSid.empty()) {
            keyBySid_.erase(previousSid);
        }
        sub.needsResubscribe = true;
        sub.consecutiveFailures = 1;
        scheduleLocked(sub, retryDelaySec(sub.consecutiveFailures, config_.retryIntervalSec));
        subscriptions_[key] = sub;
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(key);
    if (!previousSid.empty() && previousSid != granted.sid) {
        keyBySid_.erase(previousSid);
    }
    scheduleLocked(granted, renewalDelaySec(granted.grantedTimeoutSec));
    keyBySid_[granted.sid] = key;
    subscriptions_[key] = granted;
    LOG_INFO("GENA: subscribed {} (SID {}, {}s)", keyToString(deviceId, service), granted.sid,
             granted.grantedTimeoutSec);
    return granted;
}

Subscription EventSubscriber::performSubscribe(Subscription sub) {
    net::HttpRequest request;
    request.method = "SUBSCRIBE";
    request.url = sub.eventUrl;
    request.timeoutMs = config_.httpTimeoutMs;
    request.headers = {
        {"CALLBACK", "<" + sub.callbackUrl + ">"},
        {"NT", "upnp:event"},
        {"TIMEOUT", "Second-" + std::to_string(config_.requestedTimeoutSec)},
    };

    net::HttpResponse response;
    try {
        response = transport_.send(request);
    } catch (const HttpError& e) {
        throw SubscribeError("SUBSCRIBE " + sub.eventUrl + ": " + e.what());
    }
    if (!response.ok()) {
        throw SubscribeError("SUBSCRIBE " + sub.eventUrl + " returned " +
                                 std::to_string(response.status),
                             response.status);
    }
    std::string sid = net::trimWhitespace(response.header("SID"));
    if (sid.empty()) {
        throw SubscribeError("SUBSCRIBE " + sub.eventUrl + ": response carries no SID",
                             response.status);
    }

    auto now = std::chrono::steady_clock::now();
    sub.sid = sid;
    sub.grantedTimeoutSec =
        parseTimeoutHeader(response.header("TIMEOUT"), config_.requestedTimeoutSec);
    sub.subscribedAt = now;
    sub.expiresAt = now + std::chrono::seconds(sub.grantedTimeoutSec);
    sub.consecutiveFailures = 0;
    sub.needsResubscribe = false;
    return sub;
}

Subscription EventSubscriber::performRenew(Subscription sub) {
    net::HttpRequest request;
    request.method = "SUBSCRIBE";
    request.url = sub.eventUrl;
    request.timeoutMs = config_.httpTimeoutMs;
    request.headers = {
        {"SID", sub.sid},
        {"TIMEOUT", "Second-" + std::to_string(config_.requestedTimeoutSec)},
    };

    net::HttpResponse response;
    try {
        response = transport_.send(request);
    } catch (const HttpError& e) {
        throw RenewError("renew " + sub.sid + ": " + e.what());
    }
    if (!response.ok()) {
        throw RenewError("renew " + sub.sid + " returned " + std::to_string(response.status),
                         response.status);
    }

    auto now = std::chrono::steady_clock::now();
    std::string sid = net::trimWhitespace(response.header("SID"));
    if (!sid.empty()) {
        sub.sid = sid;
    }
    sub.grantedTimeoutSec = parseTimeoutHeader(response.header("TIMEOUT"), sub.grantedTimeoutSec);
    sub.expiresAt = now + std::chrono::seconds(sub.grantedTimeoutSec);
    sub.renewals++;
    sub.consecutiveFailures = 0;
    return sub;
}

void EventSubscriber::renew(const std::string& deviceId, const std::string& service) {
    Key key{deviceId, service};
    Subscription current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(key);
        if (it == subscriptions_.end()) {
            throw RenewError("no subscription for " + keyToString(deviceId, service));
        }
        current = it->second;
    }

    const std::string oldSid = current.sid;
    const bool leaseHeld = !oldSid.empty();
    Subscription updated;
    int failureStatus = 0;
    std::string failure;
    bool succeeded = false;

    if (!current.needsResubscribe) {
        try {
            updated = performRenew(current);
            succeeded = true;
        } catch (const RenewError& e) {
            failure = e.what();
            failureStatus = e.httpStatus();
            if (e.leaseRejected()) {
                LOG_WARN("GENA: {} lease unknown to device, resubscribing",
                         keyToString(deviceId, service));
                current.needsResubscribe = true;
            }
        }
    }

    if (!succeeded && current.needsResubscribe) {
        try {
            uint64_t renewals = current.renewals;
            updated = performSubscribe(current);
            updated.renewals = leaseHeld ? renewals + 1 : renewals;
            succeeded = true;
        } catch (const SubscribeError& e) {
            failure = e.what();
            if (failureStatus == 0) {
                failureStatus = e.httpStatus();
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(key);
    if (it == subscriptions_.end() || it->second.eventUrl != current.eventUrl) {
        return;  // stopped, or resubscribed at a new address meanwhile
    }
    if (succeeded) {
        if (updated.sid != oldSid) {
            if (leaseHeld) {
                keyBySid_.erase(oldSid);
            }
            keyBySid_[updated.sid] = key;
        }
        scheduleLocked(updated, renewalDelaySec(updated.grantedTimeoutSec));
        it->second = updated;
        if (leaseHeld) {
            LOG_DEBUG("GENA: renewed {} for {}s", keyToString(deviceId, service),
                      updated.grantedTimeoutSec);
        } else {
            LOG_INFO("GENA: subscribed {} after {} failed attempts (SID {}, {}s)",
                     keyToString(deviceId, service), current.consecutiveFailures, updated.sid,
                     updated.grantedTimeoutSec);
        }
        return;
    }

    Subscription& sub = it->second;
    sub.consecutiveFailures++;
    sub.needsResubscribe = current.needsResubscribe;
    scheduleLocked(sub, leaseHeld
                            ? renewalDelaySec(sub.grantedTimeoutSec)
                            : retryDelaySec(sub.consecutiveFailures, config_.retryIntervalSec));
    throw RenewError(failure, failureStatus);
}

void EventSubscriber::renewalLoop() {
    while (running_.load(std::memory_order_acquire)) {
        Key key;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto now = std::chrono::steady_clock::now();
            auto next = now + std::chrono::seconds(1);
            bool claimed = false;
            for (const auto& entry : subscriptions_) {
                if (renewing_.count(entry.first) != 0) {
                    continue;
                }
                if (entry.second.renewAt <= now) {
                    key = entry.first;
                    claimed = true;
                    break;
                }
                next = std::min(next, entry.second.renewAt);
            }
            if (!claimed) {
                renewCv_.wait_until(lock, next, [this]() {
                    return !running_.load(std::memory_order_acquire);
                });
                continue;
            }
            // Other workers skip this key until the request completes
            renewing_.insert(key);
        }

        try {
            renew(key.first, key.second);
        } catch (const RenewError& e) {
            LOG_WARN("GENA: renewal of {} failed ({}): {}", keyToString(key.first, key.second),
                     errorCodeToString(e.code()), e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        renewing_.erase(key);
    }
}

int EventSubscriber::handleNotify(const std::string& method, const std::string& path,
                                  const net::HeaderList& headers, std::string body) {
    if (method != "NOTIFY") {
        notificationsRejected_.fetch_add(1, std::memory_order_relaxed);
        return 405;
    }

    std::optional<Key> key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto sid = net::findHeader(headers, "SID");
        if (sid) {
            auto it = keyBySid_.find(*sid);
            if (it != keyBySid_.end()) {
                key = it->second;
            }
        }
        // /notify/<deviceId>/<service>
        const std::string prefix = DaemonConstants::NOTIFY_PATH_PREFIX;
        if (!key && path.rfind(prefix, 0) == 0) {
            std::string rest = path.substr(prefix.size());
            size_t slash = rest.find('/');
            if (slash != std::string::npos && slash > 0 && slash + 1 < rest.size()) {
                Key candidate{rest.substr(0, slash), rest.substr(slash + 1)};
                if (subscriptions_.count(candidate) != 0 || pending_.count(candidate) != 0) {
                    key = candidate;
                }
            }
        }
    }

    if (!key) {
        notificationsRejected_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("GENA: NOTIFY for unknown subscription at {}", path);
        return 412;
    }

    notificationsRouted_.fetch_add(1, std::memory_order_relaxed);
    if (handler_) {
        try {
            handler_(key->first, key->second, std::move(body));
        } catch (const std::exception& e) {
            LOG_ERROR("GENA: notification handler failed for {}: {}",
                      keyToString(key->first, key->second), e.what());
        }
    }
    return 200;
}

void EventSubscriber::serveConnection(int fd) {
    int status = 400;
    try {
        auto deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(kNotifyReadTimeoutMs);
        net::HttpMessage message = net::readHttpMessage(fd, deadline, false,
                                                        DaemonConstants::MAX_NOTIFY_BODY_BYTES);
        // "NOTIFY /notify/RINCON_A/ZoneGroupTopology HTTP/1.1"
        std::string method;
        std::string path;
        size_t sp1 = message.startLine.find(' ');
        if (sp1 != std::string::npos) {
            method = message.startLine.substr(0, sp1);
            size_t sp2 = message.startLine.find(' ', sp1 + 1);
            path = message.startLine.substr(sp1 + 1, sp2 == std::string::npos
                                                         ? std::string::npos
                                                         : sp2 - sp1 - 1);
        }
        status = handleNotify(method, path, message.headers, std::move(message.body));

        std::string reply = "HTTP/1.1 " + std::to_string(status) + " " + reasonPhrase(status) +
                            "\r\nCONTENT-LENGTH: 0\r\nCONNECTION: close\r\n\r\n";
        net::sendAll(fd, reply, std::chrono::steady_clock::now() +
                                    std::chrono::milliseconds(kNotifyReadTimeoutMs));
    } catch (const HttpError& e) {
        LOG_DEBUG("GENA: dropped callback connection: {}", e.what());
    }
}

void EventSubscriber::listenLoop() {
    while (running_.load(std::memory_order_acquire)) {
        pollfd pfd{};
        pfd.fd = listenFd_;
        pfd.events = POLLIN;
        int pollResult = ::poll(&pfd, 1, kPollTimeoutMs);
        if (pollResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("GENA: poll failed: {}", std::strerror(errno));
            break;
        }
        if (pollResult == 0 || (pfd.revents & POLLIN) == 0) {
            continue;
        }

        int client = ::accept(listenFd_, nullptr, nullptr);
        if (client < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_WARN("GENA: accept failed: {}", std::strerror(errno));
            }
            continue;
        }
        serveConnection(client);
        ::close(client);
    }
}

void EventSubscriber::stop() {
    bool wasRunning = running_.exchange(false, std::memory_order_acq_rel);
    renewCv_.notify_all();
    for (auto& worker : listeners_) {
        worker.join();
    }
    for (auto& worker : renewers_) {
        worker.join();
    }
    listeners_.clear();
    renewers_.clear();
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }
    if (!wasRunning) {
        return;
    }

    std::vector<Subscription> leases;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : subscriptions_) {
            leases.push_back(entry.second);
        }
        subscriptions_.clear();
        keyBySid_.clear();
        renewing_.clear();
    }

    if (config_.unsubscribeOnStop) {
        for (const auto& sub : leases) {
            if (sub.sid.empty()) {
                continue;
            }
            net::HttpRequest request;
            request.method = "UNSUBSCRIBE";
            request.url = sub.eventUrl;
            request.timeoutMs = config_.httpTimeoutMs;
            request.headers = {{"SID", sub.sid}};
            try {
                net::HttpResponse response = transport_.send(request);
                if (!response.ok()) {
                    LOG_DEBUG("GENA: UNSUBSCRIBE {} returned {}", sub.sid, response.status);
                }
            } catch (const HttpError& e) {
                LOG_DEBUG("GENA: UNSUBSCRIBE {} failed: {}", sub.sid, e.what());
            }
        }
    }
    LOG_INFO("GENA: stopped ({} subscriptions released)", leases.size());
}

std::optional<Subscription> EventSubscriber::find(const std::string& deviceId,
                                                  const std::string& service) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(Key{deviceId, service});
    if (it == subscriptions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t EventSubscriber::subscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(subscriptions_.begin(), subscriptions_.end(),
                      [](const auto& entry) { return !entry.second.sid.empty(); }));
}

nlohmann::json EventSubscriber::describe() const {
    auto now = std::chrono::steady_clock::now();
    nlohmann::json list = nlohmann::json::array();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : subscriptions_) {
        const Subscription& sub = entry.second;
        auto secondsUntil = [&](std::chrono::steady_clock::time_point tp) {
            return std::chrono::duration_cast<std::chrono::seconds>(tp - now).count();
        };
        list.push_back({{"deviceId", sub.deviceId},
                        {"service", sub.service},
                        {"sid", sub.sid},
                        {"timeoutSec", sub.grantedTimeoutSec},
                        {"renewInSec", secondsUntil(sub.renewAt)},
                        {"expiresInSec", secondsUntil(sub.expiresAt)},
                        {"renewals", sub.renewals},
                        {"failures", sub.consecutiveFailures},
                        {"needsResubscribe", sub.needsResubscribe}});
    }
    return list;
}

}  // namespace upnp
}  // namespace zonelink
