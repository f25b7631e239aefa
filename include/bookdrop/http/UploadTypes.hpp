#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace bookdrop {
namespace http {

/**
 * A file extracted from a completed upload, handed to the host once per session
 */
struct ReceivedFile {
    std::string fileName;
    std::string content;    // UTF-8 text
};

/**
 * Snapshot of the upload currently shown to the host
 */
struct UploadProgress {
    std::optional<std::string> fileName;
    std::size_t receivedBytes = 0;
    std::optional<std::size_t> totalBytes;
    bool isCompleted = false;
    std::optional<std::string> errorMessage;

    bool operator==(const UploadProgress& other) const {
        return fileName == other.fileName && receivedBytes == other.receivedBytes &&
               totalBytes == other.totalBytes && isCompleted == other.isCompleted &&
               errorMessage == other.errorMessage;
    }
    bool operator!=(const UploadProgress& other) const { return !(*this == other); }
};

/**
 * Raised when a buffered upload cannot be turned into a ReceivedFile
 */
class UploadError : public std::runtime_error {
public:
    enum class Kind {
        MissingBoundary,
        MissingFileName,
        MissingTerminator,
        UnsupportedEncoding,
    };

    UploadError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

    // Everything except an encoding problem is a structural failure
    bool isStructural() const { return kind_ != Kind::UnsupportedEncoding; }

private:
    Kind kind_;
};

} // namespace http
} // namespace bookdrop
