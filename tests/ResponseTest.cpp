#include <gtest/gtest.h>

#include <string>

#include "bookdrop/http/Response.hpp"

using bookdrop::http::Response;

namespace {

std::string bodyOf(const std::string& wire) {
    auto pos = wire.find("\r\n\r\n");
    return pos == std::string::npos ? std::string() : wire.substr(pos + 4);
}

}  // namespace

TEST(Response, PreflightHasNoBodyAndCorsHeaders) {
    const std::string wire = Response::preflight().serialize();
    EXPECT_EQ(wire.rfind("HTTP/1.1 204 No Content\r\n", 0), 0u);
    EXPECT_NE(wire.find("Access-Control-Allow-Origin: *\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Access-Control-Allow-Methods: POST, GET, OPTIONS\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Access-Control-Allow-Headers: Content-Type\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_TRUE(bodyOf(wire).empty());
}

TEST(Response, StatusText) {
    EXPECT_STREQ(bookdrop::http::statusText(200), "OK");
    EXPECT_STREQ(bookdrop::http::statusText(204), "No Content");
    EXPECT_STREQ(bookdrop::http::statusText(400), "Bad Request");
    EXPECT_STREQ(bookdrop::http::statusText(500), "Unknown");
}

TEST(Response, UploadFormPage) {
    const std::string wire = Response::uploadForm().serialize();
    EXPECT_EQ(wire.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Type: text/html; charset=utf-8\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Access-Control-Allow-Origin: *\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);

    const std::string body = bodyOf(wire);
    EXPECT_NE(body.find("enctype=\"multipart/form-data\""), std::string::npos);
    EXPECT_NE(body.find("XMLHttpRequest"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: " + std::to_string(body.size()) + "\r\n"), std::string::npos);
}

TEST(Response, SuccessPageShowsEscapedFileName) {
    const std::string wire = Response::success("<b>book</b>.txt").serialize();
    EXPECT_EQ(wire.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(wire.find("&lt;b&gt;book&lt;/b&gt;.txt"), std::string::npos);
    EXPECT_EQ(wire.find("<b>book</b>"), std::string::npos);
    EXPECT_NE(wire.find("window.location.href = '/'"), std::string::npos);
}

TEST(Response, FailurePageIsBadRequest) {
    const std::string wire = Response::failure("Could not parse file name").serialize();
    EXPECT_EQ(wire.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Type: text/html; charset=utf-8\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Could not parse file name"), std::string::npos);
    EXPECT_NE(wire.find("window.location.href = '/'"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
}
