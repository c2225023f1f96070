#include "net/http_client.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace zonelink {
namespace net {

namespace {

constexpr size_t kReadChunkBytes = 4096;
constexpr size_t kMaxHeaderBytes = 64 * 1024;
constexpr size_t kMaxResponseBodyBytes = 8 * 1024 * 1024;

std::string errnoMessage(const std::string& prefix) {
    return prefix + ": " + std::strerror(errno);
}

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return static_cast<int>(std::max<long long>(0, left.count()));
}

// Closes the wrapped descriptor on scope exit.
class SocketGuard {
   public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const {
        return fd_;
    }

   private:
    int fd_;
};

void waitFor(int fd, short events, std::chrono::steady_clock::time_point deadline,
             const char* what) {
    while (true) {
        int timeout = remainingMs(deadline);
        if (timeout <= 0) {
            throw HttpError(ErrorCode::HTTP_TIMEOUT, std::string("Timed out while ") + what);
        }
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, timeout);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw HttpError(ErrorCode::HTTP_CONNECT_FAILED, errnoMessage("poll"));
        }
        if (rc == 0) {
            throw HttpError(ErrorCode::HTTP_TIMEOUT, std::string("Timed out while ") + what);
        }
        return;
    }
}

// Returns 0 on orderly shutdown by the peer.
size_t readSome(int fd, std::string& buffer, std::chrono::steady_clock::time_point deadline) {
    char chunk[kReadChunkBytes];
    while (true) {
        waitFor(fd, POLLIN, deadline, "reading");
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, errnoMessage("recv"));
        }
        buffer.append(chunk, static_cast<size_t>(n));
        return static_cast<size_t>(n);
    }
}

int connectWithTimeout(const ParsedUrl& url, std::chrono::steady_clock::time_point deadline) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    std::string port = std::to_string(url.port);
    int gai = ::getaddrinfo(url.host.c_str(), port.c_str(), &hints, &result);
    if (gai != 0 || result == nullptr) {
        throw HttpError(ErrorCode::HTTP_RESOLVE_FAILED,
                        "Cannot resolve " + url.host + ": " + ::gai_strerror(gai));
    }
    sockaddr_in addr{};
    std::memcpy(&addr, result->ai_addr, std::min<size_t>(sizeof(addr), result->ai_addrlen));
    ::freeaddrinfo(result);

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw HttpError(ErrorCode::HTTP_CONNECT_FAILED, errnoMessage("socket"));
    }
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        std::string msg = errnoMessage("connect " + url.host + ":" + port);
        ::close(fd);
        throw HttpError(ErrorCode::HTTP_CONNECT_FAILED, msg);
    }
    if (rc < 0) {
        try {
            waitFor(fd, POLLOUT, deadline, "connecting");
        } catch (const HttpError&) {
            ::close(fd);
            throw;
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
        if (soError != 0) {
            ::close(fd);
            throw HttpError(ErrorCode::HTTP_CONNECT_FAILED, "connect " + url.host + ":" + port +
                                                                ": " + std::strerror(soError));
        }
    }
    return fd;
}

std::string serializeRequest(const HttpRequest& request, const ParsedUrl& url) {
    std::ostringstream oss;
    oss << request.method << " " << url.path << " HTTP/1.1\r\n";
    oss << "HOST: " << url.host << ":" << url.port << "\r\n";
    bool hasUserAgent = findHeader(request.headers, "User-Agent").has_value();
    if (!hasUserAgent) {
        oss << "USER-AGENT: " << DaemonConstants::USER_AGENT << "\r\n";
    }
    for (const auto& [name, value] : request.headers) {
        oss << name << ": " << value << "\r\n";
    }
    if (!request.body.empty() || request.method == "POST") {
        oss << "CONTENT-LENGTH: " << request.body.size() << "\r\n";
    }
    oss << "CONNECTION: close\r\n\r\n";
    oss << request.body;
    return oss.str();
}

// Decodes a complete chunked body. Returns false while more data is needed.
bool decodeChunked(const std::string& raw, std::string& out) {
    out.clear();
    size_t pos = 0;
    while (true) {
        size_t lineEnd = raw.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            return false;
        }
        std::string sizeText = raw.substr(pos, lineEnd - pos);
        size_t semicolon = sizeText.find(';');
        if (semicolon != std::string::npos) {
            sizeText.resize(semicolon);
        }
        sizeText = trimWhitespace(sizeText);
        char* end = nullptr;
        unsigned long chunkSize = std::strtoul(sizeText.c_str(), &end, 16);
        if (sizeText.empty() || end == nullptr || *end != '\0') {
            throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, "Invalid chunk size: " + sizeText);
        }
        pos = lineEnd + 2;
        if (chunkSize == 0) {
            return true;
        }
        if (raw.size() < pos + chunkSize + 2) {
            return false;
        }
        out.append(raw, pos, chunkSize);
        pos += chunkSize + 2;
    }
}

}  // namespace

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string toLowerAscii(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trimWhitespace(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        start++;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    return std::string(text.substr(start, end - start));
}

std::optional<std::string> findHeader(const HeaderList& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string HttpResponse::header(std::string_view name) const {
    return findHeader(headers, name).value_or(std::string());
}

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    constexpr std::string_view kScheme = "http://";
    if (url.size() <= kScheme.size() || !equalsIgnoreCase(url.substr(0, kScheme.size()), kScheme)) {
        return std::nullopt;
    }
    ParsedUrl parsed;
    parsed.scheme = "http";

    std::string rest = url.substr(kScheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    parsed.path = (slash == std::string::npos) ? "/" : rest.substr(slash);
    if (authority.empty()) {
        return std::nullopt;
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        char* end = nullptr;
        long port = std::strtol(portText.c_str(), &end, 10);
        if (portText.empty() || *end != '\0' || port <= 0 || port > 65535) {
            return std::nullopt;
        }
        parsed.port = static_cast<uint16_t>(port);
        parsed.host = authority.substr(0, colon);
    } else {
        parsed.host = authority;
    }
    if (parsed.host.empty()) {
        return std::nullopt;
    }
    return parsed;
}

std::string baseUrlOf(const std::string& location) {
    auto parsed = parseUrl(location);
    if (!parsed) {
        return {};
    }
    return "http://" + parsed->host + ":" + std::to_string(parsed->port);
}

bool parseHeaderBlock(std::string_view block, std::string& startLine, HeaderList& headers) {
    startLine.clear();
    headers.clear();

    bool first = true;
    size_t pos = 0;
    while (pos <= block.size()) {
        size_t eol = block.find('\n', pos);
        std::string_view line =
            block.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (first) {
            startLine = trimWhitespace(line);
            first = false;
        } else if (line.empty()) {
            break;
        } else {
            size_t colon = line.find(':');
            if (colon != std::string_view::npos) {
                headers.emplace_back(trimWhitespace(line.substr(0, colon)),
                                     trimWhitespace(line.substr(colon + 1)));
            }
        }
        if (eol == std::string_view::npos) {
            break;
        }
        pos = eol + 1;
    }
    return !startLine.empty();
}

HttpMessage readHttpMessage(int fd, std::chrono::steady_clock::time_point deadline,
                            bool readUntilClose, size_t maxBodyBytes) {
    std::string buffer;
    size_t headerEnd = std::string::npos;
    while ((headerEnd = buffer.find("\r\n\r\n")) == std::string::npos) {
        if (buffer.size() > kMaxHeaderBytes) {
            throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, "Header block too large");
        }
        if (readSome(fd, buffer, deadline) == 0) {
            throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, "Connection closed before headers");
        }
    }

    HttpMessage message;
    if (!parseHeaderBlock(std::string_view(buffer).substr(0, headerEnd), message.startLine,
                          message.headers)) {
        throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, "Missing start line");
    }
    std::string raw = buffer.substr(headerEnd + 4);

    auto transferEncoding = findHeader(message.headers, "Transfer-Encoding");
    auto contentLength = findHeader(message.headers, "Content-Length");

    if (transferEncoding && toLowerAscii(*transferEncoding).find("chunked") != std::string::npos) {
        while (!decodeChunked(raw, message.body)) {
            if (raw.size() > maxBodyBytes) {
                throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, "Chunked body too large");
            }
            if (readSome(fd, raw, deadline) == 0) {
                throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, "Connection closed inside chunk");
            }
        }
        return message;
    }

    if (contentLength) {
        char* end = nullptr;
        unsigned long long length = std::strtoull(contentLength->c_str(), &end, 10);
        if (contentLength->empty() || *end != '\0') {
            throw HttpError(ErrorCode::HTTP_BAD_RESPONSE,
                            "Invalid Content-Length: " + *contentLength);
        }
        if (length > maxBodyBytes) {
            throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, "Body too large");
        }
        while (raw.size() < length) {
            if (readSome(fd, raw, deadline) == 0) {
                throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, "Connection closed inside body");
            }
        }
        raw.resize(static_cast<size_t>(length));
        message.body = std::move(raw);
        return message;
    }

    if (readUntilClose) {
        while (readSome(fd, raw, deadline) != 0) {
            if (raw.size() > maxBodyBytes) {
                throw HttpError(ErrorCode::HTTP_BAD_RESPONSE, "Body too large");
            }
        }
        message.body = std::move(raw);
    }
    return message;
}

void sendAll(int fd, const std::string& data, std::chrono::steady_clock::time_point deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        waitFor(fd, POLLOUT, deadline, "sending");
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw HttpError(ErrorCode::HTTP_CONNECT_FAILED, errnoMessage("send"));
        }
        sent += static_cast<size_t>(n);
    }
}

HttpResponse PosixHttpTransport::send(const HttpRequest& request) {
    auto url = parseUrl(request.url);
    if (!url) {
        throw HttpError(ErrorCode::VALIDATION_INVALID_URL, "Invalid URL: " + request.url);
    }
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(request.timeoutMs);

    SocketGuard socket(connectWithTimeout(*url, deadline));
    sendAll(socket.get(), serializeRequest(request, *url), deadline);

    HttpMessage message = readHttpMessage(socket.get(), deadline, true, kMaxResponseBodyBytes);

    // "HTTP/1.1 200 OK"
    HttpResponse response;
    std::istringstream status(message.startLine);
    std::string version;
    status >> version >> response.status;
    if (version.rfind("HTTP/", 0) != 0 || response.status < 100 || response.status > 999) {
        throw HttpError(ErrorCode::HTTP_BAD_RESPONSE,
                        "Malformed status line from " + request.url + ": " + message.startLine);
    }
    std::getline(status, response.reason);
    response.reason = trimWhitespace(response.reason);
    response.headers = std::move(message.headers);
    response.body = std::move(message.body);

    LOG_TRACE("HTTP {} {} -> {}", request.method, request.url, response.status);
    return response;
}

}  // namespace net
}  // namespace zonelink
