#pragma once

#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bookdrop/http/Response.hpp"
#include "bookdrop/http/UploadAccumulator.hpp"
#include "bookdrop/server/UploadStatePublisher.hpp"

namespace bookdrop {
namespace server {

/**
 * One accepted connection: receive, classify, answer once, close.
 * All handlers run on the server's event loop.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    using FileHandler = std::function<void(const http::ReceivedFile&)>;

    Session(boost::asio::ip::tcp::socket socket,
            UploadStatePublisher& publisher,
            FileHandler onFileReceived,
            std::size_t maxChunkSize);

    void start();

    // Drop the connection without answering (server stop)
    void abandon();

private:
    void readHead();
    void onHead(const boost::system::error_code& ec, std::size_t bytes);
    void dispatch(bool peerClosed);

    void readBody();
    void onBody(const boost::system::error_code& ec, std::size_t bytes);
    void completeUpload();
    void failUpload(const std::string& message);

    void respond(const http::Response& response);
    void closeSocket();

    boost::asio::ip::tcp::socket socket_;
    UploadStatePublisher& publisher_;
    FileHandler onFileReceived_;
    std::vector<char> chunk_;
    std::string head_;
    std::optional<http::UploadAccumulator> upload_;
    std::string response_;
    bool abandoned_ = false;
};

} // namespace server
} // namespace bookdrop
