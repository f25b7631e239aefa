#pragma once

#include <boost/asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "bookdrop/core/Config.hpp"
#include "bookdrop/http/UploadTypes.hpp"
#include "bookdrop/server/Session.hpp"
#include "bookdrop/server/UploadStatePublisher.hpp"

namespace bookdrop {
namespace server {

struct ServerState {
    bool isRunning = false;
    std::optional<std::string> address;   // "http://<ip>:<port>"

    bool operator==(const ServerState& other) const {
        return isRunning == other.isRunning && address == other.address;
    }
    bool operator!=(const ServerState& other) const { return !(*this == other); }
};

/**
 * Notifications toward the host. Upload callbacks run on the event-loop
 * thread; running/address changes run on the thread calling start()/stop().
 */
struct ServerCallbacks {
    std::function<void(const http::ReceivedFile&)> onFileReceived;
    std::function<void(const std::optional<http::UploadProgress>&)> onProgress;
    std::function<void(const std::optional<std::string>&)> onAddressChanged;
    std::function<void(bool)> onRunningChanged;
};

/**
 * LAN upload server: serves the upload page, takes one file per
 * connection and answers CORS preflights. It owns its io_context and runs
 * it on a single worker thread while started.
 *
 * start() and stop() must not be called from inside a callback.
 */
class TransferServer
{
public:
    explicit TransferServer(core::ServerConfig config = core::ServerConfig(),
                            ServerCallbacks callbacks = ServerCallbacks());
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Bind and start accepting. A no-op returning the current state if already running.
    ServerState start(boost::system::error_code& ec);
    ServerState start();

    // Idempotent. Open sessions are abandoned.
    void stop();

    ServerState state() const;
    std::optional<http::UploadProgress> progress() const;

    // Port actually bound, 0 when not running
    uint16_t port() const;

private:
    void doAccept();
    void shutdownOnLoop();
    void notifyState(const ServerState& state);

    core::ServerConfig config_;
    ServerCallbacks callbacks_;

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    UploadStatePublisher publisher_;
    std::vector<std::weak_ptr<Session>> sessions_;
    std::thread worker_;

    mutable std::mutex stateMutex_;
    ServerState state_;
    uint16_t boundPort_ = 0;
};

} // namespace server
} // namespace bookdrop
