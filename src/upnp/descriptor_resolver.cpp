#include "upnp/descriptor_resolver.h"

#include "core/error_codes.h"
#include "logging/logger.h"
#include "net/xml_utils.h"

#include <tinyxml2.h>

namespace zonelink {
namespace upnp {

namespace {

void collectServices(const tinyxml2::XMLElement* device, std::vector<ServiceInfo>& out) {
    const auto* serviceList = net::firstChildByLocalName(device, "serviceList");
    for (const auto* service = net::firstChildByLocalName(serviceList, "service");
         service != nullptr; service = net::nextSiblingByLocalName(service, "service")) {
        ServiceInfo info;
        info.serviceType = net::childText(service, "serviceType");
        info.serviceId = net::childText(service, "serviceId");
        info.controlUrl = net::childText(service, "controlURL");
        info.eventSubUrl = net::childText(service, "eventSubURL");
        info.scpdUrl = net::childText(service, "SCPDURL");
        if (!info.serviceType.empty()) {
            out.push_back(std::move(info));
        }
    }

    const auto* deviceList = net::firstChildByLocalName(device, "deviceList");
    for (const auto* child = net::firstChildByLocalName(deviceList, "device"); child != nullptr;
         child = net::nextSiblingByLocalName(child, "device")) {
        collectServices(child, out);
    }
}

}  // namespace

std::string normalizeDeviceId(const std::string& raw) {
    std::string id = net::trimWhitespace(raw);
    if (id.size() >= 5 && net::equalsIgnoreCase(std::string_view(id).substr(0, 5), "uuid:")) {
        id.erase(0, 5);
    }
    size_t usnSuffix = id.find("::");
    if (usnSuffix != std::string::npos) {
        id.resize(usnSuffix);
    }
    return id;
}

std::string shortServiceType(const std::string& serviceType) {
    // urn:<domain>:service:<type>:<version>
    constexpr const char* kMarker = ":service:";
    size_t start = serviceType.find(kMarker);
    if (start == std::string::npos) {
        return serviceType;
    }
    start += std::char_traits<char>::length(kMarker);
    size_t end = serviceType.find(':', start);
    return serviceType.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

bool DeviceDescriptor::hasService(const std::string& shortType) const {
    for (const auto& service : services) {
        if (shortServiceType(service.serviceType) == shortType) {
            return true;
        }
    }
    return false;
}

DeviceDescriptor DescriptorResolver::parse(const std::string& xml) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        throw DescriptorParseError(std::string("Descriptor is not well-formed: ") +
                                   doc.ErrorStr());
    }
    const auto* root = net::firstChildByLocalName(&doc, "root");
    const auto* device = net::firstChildByLocalName(root, "device");
    if (device == nullptr) {
        throw DescriptorParseError("Descriptor has no root/device element",
                                   ErrorCode::DESCRIPTOR_MISSING_FIELD);
    }

    DeviceDescriptor descriptor;
    descriptor.id = normalizeDeviceId(net::childText(device, "UDN"));
    descriptor.roomName = net::childText(device, "roomName");
    if (descriptor.roomName.empty()) {
        descriptor.roomName = net::childText(device, "friendlyName");
    }
    descriptor.modelName = net::childText(device, "modelName");
    descriptor.modelNumber = net::childText(device, "modelNumber");
    descriptor.displayName = net::childText(device, "displayName");
    descriptor.softwareVersion = net::childText(device, "softwareVersion");
    descriptor.serialNumber = net::childText(device, "serialNum");

    if (descriptor.id.empty()) {
        throw DescriptorParseError("Descriptor is missing UDN",
                                   ErrorCode::DESCRIPTOR_MISSING_FIELD);
    }
    if (descriptor.roomName.empty()) {
        throw DescriptorParseError("Descriptor " + descriptor.id + " has no room name",
                                   ErrorCode::DESCRIPTOR_MISSING_FIELD);
    }
    if (descriptor.modelName.empty()) {
        throw DescriptorParseError("Descriptor " + descriptor.id + " has no modelName",
                                   ErrorCode::DESCRIPTOR_MISSING_FIELD);
    }

    collectServices(device, descriptor.services);
    return descriptor;
}

DeviceDescriptor DescriptorResolver::fetch(const std::string& location) {
    net::HttpRequest request;
    request.method = "GET";
    request.url = location;
    request.timeoutMs = timeoutMs_;

    net::HttpResponse response;
    try {
        response = transport_.send(request);
    } catch (const HttpError& e) {
        throw DescriptorFetchError("GET " + location + " failed: " + e.what());
    }
    if (!response.ok()) {
        throw DescriptorFetchError("GET " + location + " returned HTTP " +
                                   std::to_string(response.status));
    }

    DeviceDescriptor descriptor = parse(response.body);
    LOG_DEBUG("Descriptor: {} -> {} ({}, {} services)", location, descriptor.id,
              descriptor.roomName, descriptor.services.size());
    return descriptor;
}

}  // namespace upnp
}  // namespace zonelink
