#pragma once

#include "core/daemon_constants.h"
#include "core/error_codes.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace zonelink::ipc {

/**
 * @brief One request received on the REP socket.
 *
 * Raw form: "CMD" or "CMD:payload". JSON form: {"cmd": "...", "params": {...}}.
 */
struct ZmqRequest {
    std::string raw;
    std::string command;  // upper-cased
    std::string payload;  // raw form only
    bool isJson = false;
    std::optional<nlohmann::json> json;
    std::string parseError;

    // params.<name> as a string (JSON form) or the raw payload; empty if absent.
    std::string param(const std::string& name) const;
};

/**
 * @brief REP socket for queries plus a PUB socket for events.
 *
 * The PUB endpoint is derived from the REP endpoint: "<ipc path>.pub", or the
 * next TCP port.
 */
class ZmqCommandServer {
   public:
    using Handler = std::function<std::string(const ZmqRequest&)>;

    explicit ZmqCommandServer(std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH,
                              int pollTimeoutMs = 200);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    // Register before start(); names are matched case-insensitively.
    void registerCommand(const std::string& command, Handler handler);

    bool start();
    void stop();

    bool isRunning() const {
        return active_.load();
    }
    bool hasBindError() const {
        return bindError_.load();
    }

    // Non-blocking; false when the PUB socket is closed or the send failed.
    bool publish(const std::string& message);

    const std::string& endpoint() const {
        return repEndpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }
    uint64_t requestsServed() const {
        return served_.load(std::memory_order_relaxed);
    }

    static ZmqRequest parseRequest(const std::string& raw);
    static std::string errorResponse(const ZmqRequest& request, ErrorCode code,
                                     const std::string& message);
    static std::string derivePubEndpoint(const std::string& endpoint);

    // Runs the matching handler; used by the REP loop and by in-process callers.
    std::string dispatch(const ZmqRequest& request);

   private:
    struct Sockets;

    void run();
    void wakeRunLoop();
    void releaseSockets();

    std::string repEndpoint_;
    std::string pubEndpoint_;
    int pollTimeoutMs_;

    std::unordered_map<std::string, Handler> commands_;
    std::unique_ptr<Sockets> sockets_;
    std::mutex pubMutex_;
    std::thread loop_;

    std::atomic<bool> active_{false};
    std::atomic<bool> bindError_{false};
    std::atomic<uint64_t> served_{0};
};

}  // namespace zonelink::ipc
