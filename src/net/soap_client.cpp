#include "net/soap_client.h"

#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "logging/logger.h"
#include "net/xml_utils.h"

#include <cstdlib>
#include <sstream>
#include <tinyxml2.h>

namespace zonelink {
namespace net {

std::string SoapClient::buildEnvelope(const std::string& serviceType, const std::string& action,
                                      const SoapArgs& args) {
    std::ostringstream oss;
    oss << "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        << "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
        << "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        << "<s:Body><u:" << action << " xmlns:u=\"" << serviceType << "\">";
    for (const auto& [name, value] : args) {
        oss << "<" << name << ">" << xmlEscape(value) << "</" << name << ">";
    }
    oss << "</u:" << action << "></s:Body></s:Envelope>";
    return oss.str();
}

SoapResult SoapClient::parseResponse(const std::string& body, const std::string& action) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(body.c_str(), body.size()) != tinyxml2::XML_SUCCESS) {
        throw TopologyParseError(std::string("SOAP response is not well-formed: ") +
                                 doc.ErrorStr());
    }
    const auto* envelope = firstChildByLocalName(&doc, "Envelope");
    const auto* soapBody = firstChildByLocalName(envelope, "Body");
    if (soapBody == nullptr) {
        throw TopologyParseError("SOAP response has no Body element");
    }

    if (const auto* fault = firstChildByLocalName(soapBody, "Fault")) {
        std::string faultCode = childText(fault, "faultcode");
        std::string faultString = childText(fault, "faultstring");
        int upnpErrorCode = 0;
        const auto* detail = firstChildByLocalName(fault, "detail");
        if (const auto* upnpError = firstChildByLocalName(detail, "UPnPError")) {
            std::string code = childText(upnpError, "errorCode");
            if (!code.empty()) {
                upnpErrorCode = std::atoi(code.c_str());
            }
        }
        throw SoapFaultError(faultCode, faultString, upnpErrorCode);
    }

    const auto* response = soapBody->FirstChildElement();
    if (response == nullptr) {
        throw TopologyParseError("SOAP response Body is empty");
    }
    if (localName(response->Name()) != action + "Response") {
        LOG_DEBUG("SOAP: unexpected response element {} for {}", response->Name(), action);
    }

    SoapResult result;
    for (const auto* arg = response->FirstChildElement(); arg != nullptr;
         arg = arg->NextSiblingElement()) {
        const char* text = arg->GetText();
        result[std::string(localName(arg->Name()))] = text != nullptr ? text : "";
    }
    return result;
}

SoapResult SoapClient::call(const std::string& baseUrl, const std::string& controlPath,
                            const std::string& serviceType, const std::string& action,
                            const SoapArgs& args) {
    HttpRequest request;
    request.method = "POST";
    request.url = baseUrl + controlPath;
    request.timeoutMs = timeoutMs_;
    request.headers.emplace_back("CONTENT-TYPE", "text/xml; charset=\"utf-8\"");
    request.headers.emplace_back("SOAPACTION", "\"" + serviceType + "#" + action + "\"");
    request.body = buildEnvelope(serviceType, action, args);

    HttpResponse response = transport_.send(request);

    // Faults come back as 500 with an envelope; let the parser surface them.
    if (!response.ok() && response.body.find("Fault") == std::string::npos) {
        throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, action + " on " + request.url +
                                                          " returned HTTP " +
                                                          std::to_string(response.status));
    }
    return parseResponse(response.body, action);
}

std::string SoapClient::getZoneGroupState(const std::string& baseUrl) {
    SoapResult result = call(baseUrl, DaemonConstants::TOPOLOGY_CONTROL_PATH,
                             DaemonConstants::TOPOLOGY_SERVICE_TYPE, "GetZoneGroupState");
    auto it = result.find("ZoneGroupState");
    if (it == result.end() || it->second.empty()) {
        throw TopologyParseError("GetZoneGroupState response carries no ZoneGroupState");
    }
    return it->second;
}

}  // namespace net
}  // namespace zonelink
