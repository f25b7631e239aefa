#include "bookdrop/http/UploadAccumulator.hpp"
#include "bookdrop/http/MultipartParser.hpp"

#include <algorithm>
#include <stdexcept>

namespace bookdrop {
namespace http {

namespace {
    const std::string kHeaderEnd = "\r\n\r\n";
    const std::string kFileNameMarker = "filename=\"";

    // Where a marker search should resume so a marker split across appends is still found
    std::size_t resumePoint(std::size_t size, std::size_t markerSize) {
        return size >= markerSize ? size - markerSize + 1 : 0;
    }
}

UploadAccumulator::UploadAccumulator()
    : UploadAccumulator(std::nullopt) {}

UploadAccumulator::UploadAccumulator(std::optional<std::size_t> contentLength)
    : declaredContentLength_(contentLength),
      startedAt_(std::chrono::steady_clock::now()) {}

UploadAccumulator::State UploadAccumulator::append(const char* data, std::size_t size) {
    if (state_ == State::COMPLETED || state_ == State::FAILED) {
        return state_;
    }

    buffer_.append(data, size);

    if (state_ == State::AWAITING_HEADERS) {
        scanHeaders();
    }
    if (!detectedFileName_) {
        scanFileName();
    }
    return state_;
}

void UploadAccumulator::scanHeaders() {
    auto pos = buffer_.find(kHeaderEnd, headerScanFrom_);
    if (pos == std::string::npos) {
        headerScanFrom_ = resumePoint(buffer_.size(), kHeaderEnd.size());
        return;
    }

    headerEndOffset_ = pos + kHeaderEnd.size();
    if (!declaredContentLength_) {
        declaredContentLength_ = MultipartParser::extractContentLength(buffer_.substr(0, pos));
    }
    state_ = State::AWAITING_BODY;
}

void UploadAccumulator::scanFileName() {
    if (!fileNameStart_) {
        auto pos = buffer_.find(kFileNameMarker, fileNameScanFrom_);
        if (pos == std::string::npos) {
            fileNameScanFrom_ = resumePoint(buffer_.size(), kFileNameMarker.size());
            return;
        }
        fileNameStart_ = pos + kFileNameMarker.size();
        fileNameScanFrom_ = *fileNameStart_;
    }

    auto end = buffer_.find('"', fileNameScanFrom_);
    if (end == std::string::npos) {
        fileNameScanFrom_ = buffer_.size();
        return;
    }
    detectedFileName_ = buffer_.substr(*fileNameStart_, end - *fileNameStart_);
}

std::size_t UploadAccumulator::receivedBody() const {
    if (!headerEndOffset_) return 0;
    return buffer_.size() > *headerEndOffset_ ? buffer_.size() - *headerEndOffset_ : 0;
}

bool UploadAccumulator::bodyComplete() const {
    return headerEndOffset_ && declaredContentLength_ && receivedBody() >= *declaredContentLength_;
}

ReceivedFile UploadAccumulator::finish() {
    if (state_ == State::COMPLETED || state_ == State::FAILED) {
        throw std::logic_error("Upload already finalized");
    }

    try {
        ReceivedFile file = MultipartParser::extract(buffer_);
        detectedFileName_ = file.fileName;
        state_ = State::COMPLETED;
        return file;
    } catch (const UploadError& e) {
        state_ = State::FAILED;
        errorMessage_ = e.what();
        throw;
    }
}

void UploadAccumulator::fail(const std::string& message) {
    if (state_ == State::COMPLETED || state_ == State::FAILED) {
        return;
    }
    state_ = State::FAILED;
    errorMessage_ = message;
}

UploadProgress UploadAccumulator::progress() const {
    UploadProgress progress;
    progress.fileName = detectedFileName_;
    progress.totalBytes = declaredContentLength_;
    progress.isCompleted = state_ == State::COMPLETED;
    progress.errorMessage = errorMessage_;

    if (headerEndOffset_ && declaredContentLength_) {
        progress.receivedBytes = std::min(receivedBody(), *declaredContentLength_);
    } else if (progress.isCompleted) {
        // Completed on peer close without a declared length
        progress.receivedBytes = receivedBody();
    }
    return progress;
}

} // namespace http
} // namespace bookdrop
