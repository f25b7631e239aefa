#include "bookdrop/server/UploadStatePublisher.hpp"

namespace bookdrop {
namespace server {

UploadStatePublisher::UploadStatePublisher(boost::asio::io_context& io_context,
                                           std::chrono::milliseconds clearDelay,
                                           Listener listener)
    : clearTimer_(io_context), clearDelay_(clearDelay), listener_(std::move(listener)) {}

void UploadStatePublisher::store(const std::optional<http::UploadProgress>& progress)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = progress;
    }
    if (listener_) {
        listener_(progress);
    }
}

void UploadStatePublisher::publish(const http::UploadProgress& progress)
{
    ++generation_;
    clearTimer_.cancel();
    store(progress);
}

void UploadStatePublisher::publishFinal(const http::UploadProgress& progress)
{
    const uint64_t generation = ++generation_;
    store(progress);

    clearTimer_.expires_after(clearDelay_);
    clearTimer_.async_wait([this, generation](const boost::system::error_code& ec) {
        // A newer publication owns the slot now
        if (ec == boost::asio::error::operation_aborted || generation != generation_) {
            return;
        }
        store(std::nullopt);
    });
}

void UploadStatePublisher::reset()
{
    ++generation_;
    clearTimer_.cancel();
    bool hadValue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hadValue = current_.has_value();
    }
    if (hadValue) {
        store(std::nullopt);
    }
}

std::optional<http::UploadProgress> UploadStatePublisher::current() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

} // namespace server
} // namespace bookdrop
