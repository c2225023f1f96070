#include "daemon/control/zmq_server.h"

#include "logging/logger.h"
#include "net/http_client.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string_view>
#include <zmq.hpp>

namespace zonelink::ipc {

struct ZmqCommandServer::Sockets {
    zmq::context_t context{1};
    zmq::socket_t rep{context, zmq::socket_type::rep};
    zmq::socket_t pub{context, zmq::socket_type::pub};
};

namespace {

constexpr std::string_view kIpcScheme = "ipc://";
constexpr std::string_view kTcpScheme = "tcp://";
// Sent by stop() to unblock a REP loop waiting in recv().
constexpr std::string_view kWakeToken = "__ZONELINK_WAKE__";

std::string upperCased(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

// Stale socket files from a crashed daemon make bind() fail.
void unlinkIpcFile(const std::string& endpoint) {
    if (endpoint.compare(0, kIpcScheme.size(), kIpcScheme) != 0) {
        return;
    }
    std::string path = endpoint.substr(kIpcScheme.size());
    if (!path.empty()) {
        std::remove(path.c_str());
    }
}

}  // namespace

std::string ZmqRequest::param(const std::string& name) const {
    if (!json) {
        return payload;
    }
    auto params = json->find("params");
    if (params == json->end() || !params->is_object()) {
        return payload;
    }
    auto value = params->find(name);
    if (value == params->end() || !value->is_string()) {
        return "";
    }
    return value->get<std::string>();
}

ZmqCommandServer::ZmqCommandServer(std::string endpoint, int pollTimeoutMs)
    : repEndpoint_(std::move(endpoint)),
      pubEndpoint_(derivePubEndpoint(repEndpoint_)),
      pollTimeoutMs_(pollTimeoutMs) {}

ZmqCommandServer::~ZmqCommandServer() {
    stop();
}

void ZmqCommandServer::registerCommand(const std::string& command, Handler handler) {
    commands_[upperCased(command)] = std::move(handler);
}

bool ZmqCommandServer::start() {
    if (active_.load()) {
        return true;
    }

    try {
        auto sockets = std::make_unique<Sockets>();
        sockets->rep.set(zmq::sockopt::rcvtimeo, pollTimeoutMs_);
        sockets->rep.set(zmq::sockopt::linger, 0);
        sockets->pub.set(zmq::sockopt::linger, 0);

        unlinkIpcFile(repEndpoint_);
        unlinkIpcFile(pubEndpoint_);
        sockets->rep.bind(repEndpoint_);
        sockets->pub.bind(pubEndpoint_);

        std::lock_guard<std::mutex> lock(pubMutex_);
        sockets_ = std::move(sockets);
    } catch (const zmq::error_t& e) {
        LOG_ERROR("ZeroMQ: cannot bind {} / {}: {}", repEndpoint_, pubEndpoint_, e.what());
        bindError_.store(true);
        return false;
    }

    bindError_.store(false);
    active_.store(true);
    loop_ = std::thread(&ZmqCommandServer::run, this);
    LOG_INFO("ZeroMQ: REP on {}, PUB on {}", repEndpoint_, pubEndpoint_);
    return true;
}

void ZmqCommandServer::stop() {
    if (!active_.exchange(false)) {
        return;
    }

    wakeRunLoop();
    if (loop_.joinable()) {
        loop_.join();
    }
    releaseSockets();
    unlinkIpcFile(repEndpoint_);
    unlinkIpcFile(pubEndpoint_);
    LOG_INFO("ZeroMQ: closed after {} requests", requestsServed());
}

void ZmqCommandServer::wakeRunLoop() {
    try {
        zmq::context_t context{1};
        zmq::socket_t req{context, zmq::socket_type::req};
        req.set(zmq::sockopt::linger, 0);
        req.connect(repEndpoint_);
        (void)req.send(zmq::buffer(kWakeToken.data(), kWakeToken.size()),
                       zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
        LOG_DEBUG("ZeroMQ: wake-up request failed: {}", e.what());
    }
}

bool ZmqCommandServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!sockets_) {
        return false;
    }
    try {
        return sockets_->pub.send(zmq::buffer(message), zmq::send_flags::dontwait).has_value();
    } catch (const zmq::error_t& e) {
        LOG_WARN("ZeroMQ: publish failed: {}", e.what());
        return false;
    }
}

ZmqRequest ZmqCommandServer::parseRequest(const std::string& raw) {
    ZmqRequest request;
    request.raw = raw;

    // Some clients send C strings including the terminator
    std::string text = net::trimWhitespace(raw.substr(0, raw.find('\0')));
    if (text.empty()) {
        return request;
    }

    if (text.front() != '{') {
        auto colon = text.find(':');
        request.command = upperCased(text.substr(0, colon));
        if (colon != std::string::npos) {
            request.payload = text.substr(colon + 1);
        }
        return request;
    }

    request.isJson = true;
    try {
        auto parsed = nlohmann::json::parse(text);
        auto cmd = parsed.find("cmd");
        if (cmd != parsed.end() && cmd->is_string()) {
            request.command = upperCased(cmd->get<std::string>());
        }
        request.json = std::move(parsed);
    } catch (const nlohmann::json::exception& e) {
        request.parseError = e.what();
    }
    return request;
}

std::string ZmqCommandServer::dispatch(const ZmqRequest& request) {
    if (!request.parseError.empty()) {
        return errorResponse(request, ErrorCode::IPC_PROTOCOL_ERROR,
                             "Malformed JSON request: " + request.parseError);
    }

    auto handler = commands_.find(request.command);
    if (handler == commands_.end()) {
        return errorResponse(request, ErrorCode::IPC_INVALID_COMMAND,
                             "Unknown command: " +
                                 (request.command.empty() ? std::string("(empty)")
                                                          : request.command));
    }

    try {
        return handler->second(request);
    } catch (const Error& e) {
        return errorResponse(request, e.code(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("ZeroMQ: {} failed: {}", request.command, e.what());
        return errorResponse(request, ErrorCode::INTERNAL_UNKNOWN,
                             std::string("Internal error: ") + e.what());
    }
}

std::string ZmqCommandServer::errorResponse(const ZmqRequest& request, ErrorCode code,
                                            const std::string& message) {
    if (!request.isJson) {
        return "ERR:" + message;
    }
    nlohmann::json body = {
        {"status", "error"}, {"error_code", errorCodeToString(code)}, {"message", message}};
    return body.dump();
}

void ZmqCommandServer::run() {
    zmq::socket_t& rep = sockets_->rep;
    while (active_.load()) {
        try {
            zmq::message_t incoming;
            if (!rep.recv(incoming, zmq::recv_flags::none)) {
                continue;
            }

            std::string raw = incoming.to_string();
            if (raw == kWakeToken) {
                (void)rep.send(zmq::str_buffer("OK"), zmq::send_flags::dontwait);
                continue;
            }

            std::string reply = dispatch(parseRequest(raw));
            rep.send(zmq::buffer(reply), zmq::send_flags::none);
            served_.fetch_add(1, std::memory_order_relaxed);
        } catch (const zmq::error_t& e) {
            if (active_.load()) {
                LOG_WARN("ZeroMQ: request loop: {}", e.what());
            }
        }
    }
}

void ZmqCommandServer::releaseSockets() {
    std::unique_ptr<Sockets> sockets;
    {
        std::lock_guard<std::mutex> lock(pubMutex_);
        sockets = std::move(sockets_);
    }
    // Destructors close both sockets and terminate the context (linger is 0)
    sockets.reset();
}

std::string ZmqCommandServer::derivePubEndpoint(const std::string& endpoint) {
    if (endpoint.compare(0, kTcpScheme.size(), kTcpScheme) == 0) {
        auto colon = endpoint.rfind(':');
        std::string digits = endpoint.substr(colon + 1);
        bool numeric = !digits.empty() && digits.size() <= 5 &&
                       std::all_of(digits.begin(), digits.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; });
        if (numeric) {
            int port = std::stoi(digits);
            if (port > 0 && port < 65535) {
                return endpoint.substr(0, colon + 1) + std::to_string(port + 1);
            }
        }
    }
    return endpoint + DaemonConstants::ZEROMQ_PUB_SUFFIX;
}

}  // namespace zonelink::ipc
