#ifndef ZONELINK_UPNP_DESCRIPTOR_RESOLVER_H
#define ZONELINK_UPNP_DESCRIPTOR_RESOLVER_H

#include "net/http_client.h"

#include <string>
#include <vector>

namespace zonelink {
namespace upnp {

struct ServiceInfo {
    std::string serviceType;  // urn:schemas-upnp-org:service:ZoneGroupTopology:1
    std::string serviceId;
    std::string controlUrl;
    std::string eventSubUrl;
    std::string scpdUrl;
};

/**
 * @brief Identity record parsed from a device description document.
 */
struct DeviceDescriptor {
    std::string id;  // UDN without the "uuid:" prefix
    std::string roomName;
    std::string modelName;
    std::string modelNumber;
    std::string displayName;
    std::string softwareVersion;
    std::string serialNumber;
    std::vector<ServiceInfo> services;  // root device first, then embedded devices

    // True when any listed service has the given short type ("ZoneGroupTopology").
    bool hasService(const std::string& shortType) const;
};

/**
 * @brief Fetches and parses UPnP device descriptions.
 */
class DescriptorResolver {
   public:
    DescriptorResolver(net::HttpTransport& transport, int timeoutMs)
        : transport_(transport), timeoutMs_(timeoutMs) {}

    /**
     * @brief GET the descriptor at location and parse it.
     *
     * @throws DescriptorFetchError on transport failure, timeout or a non-2xx status
     * @throws DescriptorParseError on malformed XML or a missing UDN/room/model
     */
    DeviceDescriptor fetch(const std::string& location);

    // @throws DescriptorParseError
    static DeviceDescriptor parse(const std::string& xml);

   private:
    net::HttpTransport& transport_;
    int timeoutMs_;
};

/**
 * @brief Canonical device identifier.
 *
 * Strips a leading "uuid:" (any case) and a USN suffix starting at "::", so
 * "uuid:RINCON_A::urn:schemas-upnp-org:device:ZonePlayer:1" -> "RINCON_A".
 */
std::string normalizeDeviceId(const std::string& raw);

// "ZoneGroupTopology" from "urn:schemas-upnp-org:service:ZoneGroupTopology:1"
std::string shortServiceType(const std::string& serviceType);

}  // namespace upnp
}  // namespace zonelink

#endif  // ZONELINK_UPNP_DESCRIPTOR_RESOLVER_H
