#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

#include "bookdrop/http/UploadTypes.hpp"

namespace bookdrop {
namespace server {

/**
 * Single shared upload-progress slot. Last writer wins.
 *
 * Writes happen on the event loop; current() copies out under a lock so
 * any thread may read it. A final publication is cleared after the
 * configured grace period by a timer on the same loop.
 */
class UploadStatePublisher {
public:
    using Listener = std::function<void(const std::optional<http::UploadProgress>&)>;

    UploadStatePublisher(boost::asio::io_context& io_context,
                         std::chrono::milliseconds clearDelay,
                         Listener listener = Listener());

    // Publish an in-flight update; cancels a pending clear
    void publish(const http::UploadProgress& progress);

    // Publish a completed or failed update and schedule its clearing
    void publishFinal(const http::UploadProgress& progress);

    // Cancel any pending clear and empty the slot
    void reset();

    std::optional<http::UploadProgress> current() const;

private:
    void store(const std::optional<http::UploadProgress>& progress);

    boost::asio::steady_timer clearTimer_;
    std::chrono::milliseconds clearDelay_;
    Listener listener_;
    uint64_t generation_ = 0;

    mutable std::mutex mutex_;
    std::optional<http::UploadProgress> current_;
};

} // namespace server
} // namespace bookdrop
