#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "bookdrop/http/UploadTypes.hpp"

namespace bookdrop {
namespace http {

/**
 * Buffers one multipart upload across any number of receives.
 *
 * The accumulator owns the raw request bytes (HTTP headers included) and
 * tracks where the headers end, the declared Content-Length and the file
 * name as soon as each becomes visible. It performs no I/O; the session
 * feeds it and asks for progress.
 *
 * Awaiting-Headers -> Awaiting-Body -> Completed | Failed
 */
class UploadAccumulator {
public:
    enum class State {
        AWAITING_HEADERS,
        AWAITING_BODY,
        COMPLETED,
        FAILED,
    };

    UploadAccumulator();

    // contentLength is a hint taken from the request head, if it held one
    explicit UploadAccumulator(std::optional<std::size_t> contentLength);

    /**
     * Append received bytes. Ignored once the session is finalized.
     * @return State after the append
     */
    State append(const char* data, std::size_t size);
    State append(const std::string& bytes) { return append(bytes.data(), bytes.size()); }

    // True once a declared Content-Length is satisfied by the buffered body
    bool bodyComplete() const;

    /**
     * Run the final extraction over everything buffered.
     * @throws UploadError on failure (state becomes FAILED)
     * @throws std::logic_error if already finalized
     */
    ReceivedFile finish();

    // Mark the session failed for a reason outside the parser (transport error)
    void fail(const std::string& message);

    UploadProgress progress() const;

    State state() const { return state_; }
    const std::string& buffer() const { return buffer_; }
    std::optional<std::size_t> headerEndOffset() const { return headerEndOffset_; }
    std::optional<std::size_t> declaredContentLength() const { return declaredContentLength_; }
    std::optional<std::string> detectedFileName() const { return detectedFileName_; }
    std::chrono::steady_clock::time_point startedAt() const { return startedAt_; }

private:
    std::string buffer_;
    std::optional<std::size_t> headerEndOffset_;
    std::optional<std::size_t> declaredContentLength_;
    std::optional<std::string> detectedFileName_;
    std::optional<std::string> errorMessage_;
    std::chrono::steady_clock::time_point startedAt_;
    State state_ = State::AWAITING_HEADERS;

    // Resume points so each append only scans new bytes
    std::size_t headerScanFrom_ = 0;
    std::size_t fileNameScanFrom_ = 0;
    std::optional<std::size_t> fileNameStart_;

    std::size_t receivedBody() const;
    void scanHeaders();
    void scanFileName();
};

} // namespace http
} // namespace bookdrop
