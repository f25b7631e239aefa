#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <chrono>
#include <optional>
#include <vector>

#include "bookdrop/server/UploadStatePublisher.hpp"

using namespace bookdrop;
using bookdrop::server::UploadStatePublisher;

namespace {

http::UploadProgress progressOf(std::size_t received, bool completed = false) {
    http::UploadProgress p;
    p.fileName = "a.txt";
    p.receivedBytes = received;
    p.totalBytes = 100;
    p.isCompleted = completed;
    return p;
}

}  // namespace

TEST(UploadStatePublisher, FinalPublicationClearsAfterDelay) {
    boost::asio::io_context io;
    std::vector<std::optional<http::UploadProgress>> seen;
    UploadStatePublisher publisher(io, std::chrono::milliseconds(20),
                                   [&seen](const std::optional<http::UploadProgress>& p) { seen.push_back(p); });

    publisher.publish(progressOf(10));
    publisher.publishFinal(progressOf(100, true));
    ASSERT_TRUE(publisher.current());
    EXPECT_TRUE(publisher.current()->isCompleted);

    auto start = std::chrono::steady_clock::now();
    io.run();
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));

    EXPECT_FALSE(publisher.current());
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], progressOf(10));
    EXPECT_EQ(seen[1], progressOf(100, true));
    EXPECT_FALSE(seen[2]);
}

TEST(UploadStatePublisher, NewUploadCancelsPendingClear) {
    boost::asio::io_context io;
    UploadStatePublisher publisher(io, std::chrono::milliseconds(10));

    publisher.publishFinal(progressOf(100, true));
    publisher.publish(progressOf(5));
    io.run();

    ASSERT_TRUE(publisher.current());
    EXPECT_EQ(*publisher.current(), progressOf(5));
}

TEST(UploadStatePublisher, ResetEmptiesSlot) {
    boost::asio::io_context io;
    int notifications = 0;
    UploadStatePublisher publisher(io, std::chrono::seconds(10),
                                   [&notifications](const std::optional<http::UploadProgress>&) { ++notifications; });

    publisher.reset();
    EXPECT_EQ(notifications, 0);

    publisher.publishFinal(progressOf(100, true));
    publisher.reset();
    io.run();

    EXPECT_FALSE(publisher.current());
    EXPECT_EQ(notifications, 2);
}
