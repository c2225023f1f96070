#include "net/network_utils.h"

#include "logging/logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace zonelink {
namespace net {

std::vector<InterfaceAddress> listIpv4Interfaces() {
    std::vector<InterfaceAddress> result;
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        LOG_WARN("getifaddrs failed: {}", std::strerror(errno));
        return result;
    }
    for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0) {
            continue;
        }
        char buf[INET_ADDRSTRLEN] = {};
        auto* addr = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        if (::inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf)) == nullptr) {
            continue;
        }
        InterfaceAddress entry;
        entry.name = it->ifa_name != nullptr ? it->ifa_name : "";
        entry.address = buf;
        entry.loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
        result.push_back(std::move(entry));
    }
    ::freeifaddrs(list);
    return result;
}

bool sameSubnet24(const std::string& a, const std::string& b) {
    in_addr lhs{};
    in_addr rhs{};
    if (::inet_pton(AF_INET, a.c_str(), &lhs) != 1 || ::inet_pton(AF_INET, b.c_str(), &rhs) != 1) {
        return false;
    }
    uint32_t mask = htonl(0xFFFFFF00u);
    return (lhs.s_addr & mask) == (rhs.s_addr & mask);
}

std::string selectLocalAddress(const std::vector<InterfaceAddress>& interfaces,
                               const std::string& peerAddress) {
    if (!peerAddress.empty()) {
        for (const auto& iface : interfaces) {
            if (!iface.loopback && sameSubnet24(iface.address, peerAddress)) {
                return iface.address;
            }
        }
    }
    for (const auto& iface : interfaces) {
        if (!iface.loopback) {
            return iface.address;
        }
    }
    return "127.0.0.1";
}

std::string selectLocalAddress(const std::string& peerAddress) {
    return selectLocalAddress(listIpv4Interfaces(), peerAddress);
}

}  // namespace net
}  // namespace zonelink
