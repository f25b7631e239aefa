#include "bookdrop/server/TransferServer.hpp"
#include "bookdrop/server/LocalAddress.hpp"

#include <algorithm>
#include <iostream>

namespace bookdrop {
namespace server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

TransferServer::TransferServer(core::ServerConfig config, ServerCallbacks callbacks)
    : config_(std::move(config)),
      callbacks_(std::move(callbacks)),
      acceptor_(io_context_),
      publisher_(io_context_, config_.clearDelay, callbacks_.onProgress) {}

TransferServer::~TransferServer()
{
    stop();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

ServerState TransferServer::start()
{
    boost::system::error_code ec;
    ServerState state = start(ec);
    if (ec) {
        std::cerr << "Transfer server not started: " << ec.message() << std::endl;
    }
    return state;
}

ServerState TransferServer::start(boost::system::error_code& ec)
{
    ec.clear();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_.isRunning) {
            return state_;
        }
    }

    // Left over from a stop() issued on the loop thread
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
    io_context_.restart();

    tcp::endpoint endpoint(tcp::v4(), config_.port);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        std::cerr << "Failed to listen on port " << config_.port << ": " << ec.message() << std::endl;
        boost::system::error_code ignored_ec;
        acceptor_.close(ignored_ec);
        return state();
    }

    const uint16_t port = acceptor_.local_endpoint(ec).port();
    if (ec) {
        std::cerr << "Failed to read bound endpoint: " << ec.message() << std::endl;
        boost::system::error_code ignored_ec;
        acceptor_.close(ignored_ec);
        return state();
    }

    ServerState newState;
    newState.isRunning = true;
    if (auto ip = resolveLocalAddress(config_.interfaceName)) {
        newState.address = "http://" + *ip + ":" + std::to_string(port);
    } else {
        std::cerr << "No IPv4 address on interface '" << config_.interfaceName
                  << "'; server running with unknown address" << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = newState;
        boundPort_ = port;
    }

    doAccept();
    worker_ = std::thread([this] { io_context_.run(); });

    std::cout << "Transfer server listening on port " << port;
    if (newState.address) std::cout << " (" << *newState.address << ")";
    std::cout << std::endl;

    notifyState(newState);
    return newState;
}

void TransferServer::stop()
{
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!state_.isRunning) {
            return;
        }
        state_ = ServerState();
        boundPort_ = 0;
    }

    asio::post(io_context_, [this] { shutdownOnLoop(); });
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }

    std::cout << "Transfer server stopped" << std::endl;
    notifyState(ServerState());
}

void TransferServer::shutdownOnLoop()
{
    boost::system::error_code ignored_ec;
    acceptor_.close(ignored_ec);

    for (auto& weak : sessions_) {
        if (auto session = weak.lock()) {
            session->abandon();
        }
    }
    sessions_.clear();
    publisher_.reset();
}

void TransferServer::doAccept()
{
    acceptor_.async_accept(
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }

            if (ec) {
                std::cerr << "Accept failed: " << ec.message() << std::endl;
            } else {
                sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                               [](const std::weak_ptr<Session>& s) { return s.expired(); }),
                                sessions_.end());

                auto session = std::make_shared<Session>(std::move(socket), publisher_,
                                                         callbacks_.onFileReceived, config_.maxChunkSize);
                sessions_.push_back(session);
                session->start();
            }

            // Keep listening regardless of how this connection went
            doAccept();
        });
}

void TransferServer::notifyState(const ServerState& state)
{
    if (callbacks_.onRunningChanged) {
        callbacks_.onRunningChanged(state.isRunning);
    }
    if (callbacks_.onAddressChanged) {
        callbacks_.onAddressChanged(state.address);
    }
}

ServerState TransferServer::state() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

std::optional<http::UploadProgress> TransferServer::progress() const
{
    return publisher_.current();
}

uint16_t TransferServer::port() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return boundPort_;
}

} // namespace server
} // namespace bookdrop
