#pragma once

#include <boost/asio.hpp>
#include <algorithm>
#include <cstdint>
#include <string>

namespace bookdrop {
namespace test {

// Multipart body carrying one file field named "book"
inline std::string makeMultipartBody(const std::string& fileName, const std::string& content,
                                     const std::string& boundary) {
    std::string body;
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"book\"; filename=\"" + fileName + "\"\r\n";
    body += "Content-Type: text/plain\r\n\r\n";
    body += content;
    body += "\r\n--" + boundary + "--\r\n";
    return body;
}

inline std::string makeUploadRequest(const std::string& fileName, const std::string& content,
                                     const std::string& boundary = "----BookBoundary7MA4YWxk",
                                     bool withContentLength = true) {
    const std::string body = makeMultipartBody(fileName, content, boundary);
    std::string request;
    request += "POST /upload HTTP/1.1\r\n";
    request += "Host: 127.0.0.1:8080\r\n";
    request += "Content-Type: multipart/form-data; boundary=" + boundary + "\r\n";
    if (withContentLength) {
        request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    request += "\r\n";
    request += body;
    return request;
}

/**
 * Send a raw request to the local server and read until the server closes.
 * chunkSize 0 writes everything at once. closeSend half-closes after writing.
 */
inline std::string roundTrip(uint16_t port, const std::string& request,
                             std::size_t chunkSize = 0, bool closeSend = false) {
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    asio::io_context io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(asio::ip::address_v4::loopback(), port));

    if (chunkSize == 0) {
        asio::write(socket, asio::buffer(request));
    } else {
        for (std::size_t pos = 0; pos < request.size(); pos += chunkSize) {
            asio::write(socket, asio::buffer(request.data() + pos, std::min(chunkSize, request.size() - pos)));
        }
    }
    if (closeSend) {
        socket.shutdown(tcp::socket::shutdown_send);
    }

    std::string response;
    char buf[4096];
    boost::system::error_code ec;
    for (;;) {
        std::size_t n = socket.read_some(asio::buffer(buf), ec);
        response.append(buf, n);
        if (ec) break;
    }
    return response;
}

} // namespace test
} // namespace bookdrop
