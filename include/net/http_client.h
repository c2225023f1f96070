#ifndef ZONELINK_NET_HTTP_CLIENT_H
#define ZONELINK_NET_HTTP_CLIENT_H

#include "core/daemon_constants.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zonelink {
namespace net {

// Ordered header list; names compare case-insensitively.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

bool equalsIgnoreCase(std::string_view a, std::string_view b);
std::string toLowerAscii(std::string_view text);
std::string trimWhitespace(std::string_view text);

// First value of the named header, if present.
std::optional<std::string> findHeader(const HeaderList& headers, std::string_view name);

struct ParsedUrl {
    std::string scheme;
    std::string host;
    uint16_t port = 80;
    std::string path = "/";  // includes query string
};

// Only http:// URLs are accepted.
std::optional<ParsedUrl> parseUrl(const std::string& url);

/**
 * @brief "http://host:port" part of a device location, or empty when the URL is invalid.
 *
 * "http://10.0.0.5:1400/xml/device_description.xml" -> "http://10.0.0.5:1400"
 */
std::string baseUrlOf(const std::string& location);

/**
 * @brief Split a CRLF (or LF) separated header block into its first line and headers.
 *
 * Used for HTTP responses, NOTIFY requests and SSDP datagrams alike. Lines
 * without a colon after the first are ignored; values are trimmed.
 *
 * @return false if the block has no start line
 */
bool parseHeaderBlock(std::string_view block, std::string& startLine, HeaderList& headers);

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderList headers;
    std::string body;
    int timeoutMs = DaemonConstants::DEFAULT_HTTP_TIMEOUT_MS;
};

struct HttpResponse {
    int status = 0;
    std::string reason;
    HeaderList headers;
    std::string body;

    bool ok() const {
        return status >= 200 && status < 300;
    }
    std::string header(std::string_view name) const;
};

/**
 * @brief Raw message read off a socket (request or response).
 */
struct HttpMessage {
    std::string startLine;
    HeaderList headers;
    std::string body;
};

/**
 * @brief Read one HTTP/1.1 message from a connected socket.
 *
 * The body is framed by Content-Length or chunked transfer encoding. When
 * neither is present, a response (readUntilClose=true) reads until the peer
 * closes and a request has an empty body.
 *
 * @throws HttpError on timeout, peer reset or a malformed message
 */
HttpMessage readHttpMessage(int fd, std::chrono::steady_clock::time_point deadline,
                            bool readUntilClose, size_t maxBodyBytes);

// Write the whole buffer before the deadline. Throws HttpError.
void sendAll(int fd, const std::string& data, std::chrono::steady_clock::time_point deadline);

/**
 * @brief Seam between the UPnP components and the network.
 *
 * Non-2xx statuses are returned as responses; only transport failures throw.
 */
class HttpTransport {
   public:
    virtual ~HttpTransport() = default;

    // @throws HttpError (resolve, connect, timeout, malformed response)
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * @brief HTTP/1.1 over blocking POSIX TCP sockets, one connection per request.
 */
class PosixHttpTransport : public HttpTransport {
   public:
    HttpResponse send(const HttpRequest& request) override;
};

}  // namespace net
}  // namespace zonelink

#endif  // ZONELINK_NET_HTTP_CLIENT_H
