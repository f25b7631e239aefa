#include <gtest/gtest.h>

#include <string>

#include "TestUtil.hpp"
#include "bookdrop/http/Request.hpp"

using namespace bookdrop;
using bookdrop::http::RequestClassifier;
using bookdrop::http::RequestKind;

TEST(RequestClassifier, OptionsIsPreflight) {
    auto head = RequestClassifier::classify(
        "OPTIONS /upload HTTP/1.1\r\nContent-Type: multipart/form-data; boundary=x\r\n\r\n");
    EXPECT_EQ(head.kind, RequestKind::OPTIONS);
    EXPECT_TRUE(head.boundary.empty());
}

TEST(RequestClassifier, MultipartIsUpload) {
    const std::string request = test::makeUploadRequest("a.txt", "abc", "Bnd42");
    auto head = RequestClassifier::classify(request);
    EXPECT_EQ(head.kind, RequestKind::UPLOAD);
    EXPECT_EQ(head.boundary, "Bnd42");
    ASSERT_TRUE(head.contentLength);
    EXPECT_EQ(*head.contentLength, request.size() - request.find("\r\n\r\n") - 4);
}

TEST(RequestClassifier, MultipartHeaderCaseInsensitive) {
    auto head = RequestClassifier::classify(
        "POST /upload HTTP/1.1\r\ncontent-type: Multipart/Form-Data; boundary=q\r\n\r\n");
    EXPECT_EQ(head.kind, RequestKind::UPLOAD);
    EXPECT_EQ(head.boundary, "q");
    EXPECT_FALSE(head.contentLength);
}

TEST(RequestClassifier, IncompleteHeadDoesNotTrustValues) {
    auto head = RequestClassifier::classify(
        "POST /upload HTTP/1.1\r\nContent-Type: multipart/form-data; boundary=abc\r\nContent-Length: 12");
    EXPECT_EQ(head.kind, RequestKind::UPLOAD);
    EXPECT_FALSE(head.contentLength);
    EXPECT_TRUE(head.boundary.empty());
}

TEST(RequestClassifier, EverythingElseGetsTheForm) {
    EXPECT_EQ(RequestClassifier::classify("GET / HTTP/1.1\r\nHost: x\r\n\r\n").kind, RequestKind::FORM);
    EXPECT_EQ(RequestClassifier::classify("GET /favicon.ico HTTP/1.1\r\n\r\n").kind, RequestKind::FORM);
    EXPECT_EQ(RequestClassifier::classify("POST /upload HTTP/1.1\r\nContent-Type: text/plain\r\n\r\nx").kind,
              RequestKind::FORM);
}

TEST(RequestClassifier, HeadComplete) {
    EXPECT_FALSE(RequestClassifier::headComplete("OPTIONS"));
    EXPECT_FALSE(RequestClassifier::headComplete("OPTIONS /upload HTTP/1.1\r\nOrigin: null\r\n"));
    EXPECT_TRUE(RequestClassifier::headComplete("OPTIONS /upload HTTP/1.1\r\nOrigin: null\r\n\r\n"));
    EXPECT_TRUE(RequestClassifier::headComplete("GET / HTTP/1.1\r\n\r\n"));
    EXPECT_FALSE(RequestClassifier::headComplete("GET / HTTP/1.1\r\nHost: x\r\n"));
}
