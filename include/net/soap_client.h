#ifndef ZONELINK_NET_SOAP_CLIENT_H
#define ZONELINK_NET_SOAP_CLIENT_H

#include "net/http_client.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace zonelink {
namespace net {

using SoapArgs = std::vector<std::pair<std::string, std::string>>;
using SoapResult = std::map<std::string, std::string>;

/**
 * @brief UPnP SOAP 1.1 action invocation over an HttpTransport.
 */
class SoapClient {
   public:
    SoapClient(HttpTransport& transport, int timeoutMs)
        : transport_(transport), timeoutMs_(timeoutMs) {}

    /**
     * @brief Invoke an action and return its output arguments (name -> decoded text).
     *
     * @throws SoapFaultError when the device answers with a Fault element
     * @throws HttpError on transport failures or a non-2xx reply without a Fault
     * @throws TopologyParseError when the response envelope is not well-formed
     */
    SoapResult call(const std::string& baseUrl, const std::string& controlPath,
                    const std::string& serviceType, const std::string& action,
                    const SoapArgs& args = {});

    // Raw ZoneGroupState document of the household as seen by the device at baseUrl.
    std::string getZoneGroupState(const std::string& baseUrl);

    static std::string buildEnvelope(const std::string& serviceType, const std::string& action,
                                     const SoapArgs& args);

    // Parse a response envelope. Throws like call().
    static SoapResult parseResponse(const std::string& body, const std::string& action);

   private:
    HttpTransport& transport_;
    int timeoutMs_;
};

}  // namespace net
}  // namespace zonelink

#endif  // ZONELINK_NET_SOAP_CLIENT_H
