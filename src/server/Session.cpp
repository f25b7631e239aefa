#include "bookdrop/server/Session.hpp"
#include "bookdrop/http/Request.hpp"

#include <iostream>

namespace bookdrop {
namespace server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

Session::Session(tcp::socket socket,
                 UploadStatePublisher& publisher,
                 FileHandler onFileReceived,
                 std::size_t maxChunkSize)
    : socket_(std::move(socket)),
      publisher_(publisher),
      onFileReceived_(std::move(onFileReceived)),
      chunk_(maxChunkSize) {}

void Session::start()
{
    readHead();
}

void Session::abandon()
{
    abandoned_ = true;
    closeSocket();
}

void Session::readHead()
{
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(chunk_),
        [this, self](const boost::system::error_code& ec, std::size_t bytes) {
            onHead(ec, bytes);
        });
}

void Session::onHead(const boost::system::error_code& ec, std::size_t bytes)
{
    if (abandoned_) return;

    head_.append(chunk_.data(), bytes);

    if (ec == asio::error::eof && !head_.empty()) {
        dispatch(true);
        return;
    }
    if (ec) {
        if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
            std::cerr << "Receive failed before request head: " << ec.message() << std::endl;
        }
        closeSocket();
        return;
    }

    // A head that never terminates is classified on what fits in one chunk
    if (http::RequestClassifier::headComplete(head_) || head_.size() >= chunk_.size()) {
        dispatch(false);
    } else {
        readHead();
    }
}

void Session::dispatch(bool peerClosed)
{
    http::RequestHead head = http::RequestClassifier::classify(head_);

    switch (head.kind) {
        case http::RequestKind::OPTIONS:
            respond(http::Response::preflight());
            return;
        case http::RequestKind::FORM:
            respond(http::Response::uploadForm());
            return;
        case http::RequestKind::UPLOAD:
            break;
    }

    std::cout << "Upload started (boundary: " << (head.boundary.empty() ? "?" : head.boundary)
              << ", declared length: "
              << (head.contentLength ? std::to_string(*head.contentLength) : std::string("unknown"))
              << ")" << std::endl;

    upload_.emplace(head.contentLength);
    upload_->append(head_);
    head_.clear();
    publisher_.publish(upload_->progress());

    if (upload_->bodyComplete() || peerClosed) {
        completeUpload();
    } else {
        readBody();
    }
}

void Session::readBody()
{
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(chunk_),
        [this, self](const boost::system::error_code& ec, std::size_t bytes) {
            onBody(ec, bytes);
        });
}

void Session::onBody(const boost::system::error_code& ec, std::size_t bytes)
{
    if (abandoned_) return;

    if (bytes > 0) {
        upload_->append(chunk_.data(), bytes);
    }

    if (ec == asio::error::eof) {
        // Peer finished sending without satisfying (or declaring) a length
        completeUpload();
        return;
    }
    if (ec) {
        std::cerr << "Receive failed during upload: " << ec.message() << std::endl;
        failUpload("Error while receiving data");
        return;
    }

    publisher_.publish(upload_->progress());

    if (upload_->bodyComplete()) {
        completeUpload();
    } else {
        readBody();
    }
}

void Session::completeUpload()
{
    http::ReceivedFile file;
    try {
        file = upload_->finish();
    } catch (const http::UploadError& e) {
        std::cerr << "Upload parse failed: " << e.what() << std::endl;
        publisher_.publishFinal(upload_->progress());
        respond(http::Response::failure(e.what()));
        return;
    }

    std::cout << "Upload finished: " << file.fileName << " (" << file.content.size() << " bytes)" << std::endl;
    publisher_.publishFinal(upload_->progress());

    if (onFileReceived_) {
        try {
            onFileReceived_(file);
        } catch (const std::exception& e) {
            std::cerr << "File received handler failed: " << e.what() << std::endl;
        }
    }

    respond(http::Response::success(file.fileName));
}

void Session::failUpload(const std::string& message)
{
    upload_->fail(message);
    publisher_.publishFinal(upload_->progress());
    closeSocket();
}

void Session::respond(const http::Response& response)
{
    response_ = response.serialize();

    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(response_),
        [this, self](const boost::system::error_code& ec, std::size_t) {
            if (ec && ec != asio::error::operation_aborted) {
                std::cerr << "Send failed: " << ec.message() << std::endl;
            }
            closeSocket();
        });
}

void Session::closeSocket()
{
    if (!socket_.is_open()) return;

    boost::system::error_code ignored_ec;
    socket_.shutdown(tcp::socket::shutdown_both, ignored_ec);
    socket_.close(ignored_ec);
}

} // namespace server
} // namespace bookdrop
