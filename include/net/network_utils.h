#ifndef ZONELINK_NET_NETWORK_UTILS_H
#define ZONELINK_NET_NETWORK_UTILS_H

#include <string>
#include <vector>

namespace zonelink {
namespace net {

struct InterfaceAddress {
    std::string name;
    std::string address;  // dotted IPv4
    bool loopback = false;
};

// IPv4 addresses of interfaces that are up (getifaddrs).
std::vector<InterfaceAddress> listIpv4Interfaces();

/**
 * @brief Choose the address devices should use to reach this host.
 *
 * Preference: a non-loopback address on the same /24 as peerAddress, then any
 * non-loopback address, then 127.0.0.1.
 */
std::string selectLocalAddress(const std::vector<InterfaceAddress>& interfaces,
                               const std::string& peerAddress);

// Convenience overload that enumerates the host's interfaces.
std::string selectLocalAddress(const std::string& peerAddress);

bool sameSubnet24(const std::string& a, const std::string& b);

}  // namespace net
}  // namespace zonelink

#endif  // ZONELINK_NET_NETWORK_UTILS_H
