/**
 * @file fake_zone_player.h
 * @brief Loopback UDP responder that answers M-SEARCH requests with canned datagrams
 */

#pragma once

#include <arpa/inet.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace zonelink {
namespace test_support {

// SSDP search response as a ZonePlayer sends it.
inline std::string ssdpSearchResponse(const std::string& location, const std::string& usnId,
                                      const std::string& st =
                                          "urn:schemas-upnp-org:device:ZonePlayer:1") {
    return "HTTP/1.1 200 OK\r\n"
           "CACHE-CONTROL: max-age = 1800\r\n"
           "EXT:\r\n"
           "LOCATION: " +
           location +
           "\r\n"
           "SERVER: Linux UPnP/1.0 Sonos/78.1-52020 (ZPS18)\r\n"
           "ST: " +
           st +
           "\r\n"
           "USN: uuid:" +
           usnId + "::" + st + "\r\n\r\n";
}

class FakeZonePlayer {
   public:
    explicit FakeZonePlayer(std::vector<std::string> replies) : replies_(std::move(replies)) {
        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        worker_ = std::thread([this]() { serve(); });
    }

    ~FakeZonePlayer() {
        running_ = false;
        worker_.join();
        ::close(fd_);
    }

    FakeZonePlayer(const FakeZonePlayer&) = delete;
    FakeZonePlayer& operator=(const FakeZonePlayer&) = delete;

    uint16_t port() const {
        return port_;
    }

    // While muted, requests are counted but not answered.
    void setMuted(bool muted) {
        muted_ = muted;
    }

    size_t requestsReceived() const {
        return requestsReceived_.load();
    }

    std::string lastRequest() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastRequest_;
    }

   private:
    void serve() {
        char buf[2048];
        while (running_) {
            pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            sockaddr_in src{};
            socklen_t srcLen = sizeof(src);
            ssize_t n = ::recvfrom(fd_, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&src),
                                   &srcLen);
            if (n <= 0) {
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                lastRequest_.assign(buf, static_cast<size_t>(n));
            }
            requestsReceived_++;
            if (muted_) {
                continue;
            }
            for (const auto& reply : replies_) {
                ::sendto(fd_, reply.data(), reply.size(), 0, reinterpret_cast<sockaddr*>(&src),
                         srcLen);
            }
        }
    }

    std::vector<std::string> replies_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{true};
    std::atomic<bool> muted_{false};
    std::atomic<size_t> requestsReceived_{0};
    std::thread worker_;
    std::mutex mutex_;
    std::string lastRequest_;
};

}  // namespace test_support
}  // namespace zonelink
