#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "bookdrop/http/UploadTypes.hpp"

namespace bookdrop {
namespace http {

/**
 * Substring-level helpers for the single-file multipart/form-data uploads
 * sent by the upload page. This is intentionally not a conforming MIME
 * parser: it looks for fixed markers in the raw request bytes.
 */
class MultipartParser {
public:
    /**
     * Extract the boundary token from request headers
     * @param head Request head (or any text holding a "boundary=" parameter)
     * @return Boundary string (without --) or empty if not found
     */
    static std::string extractBoundary(const std::string& head);

    /**
     * Extract the value of the first filename="..." parameter
     * @param text Buffered request bytes
     * @return File name, or nullopt while the closing quote has not arrived
     */
    static std::optional<std::string> extractFileName(const std::string& text);

    /**
     * Extract the declared Content-Length header value
     * @param head Request head
     * @return Declared body length, or nullopt if absent or malformed
     */
    static std::optional<std::size_t> extractContentLength(const std::string& head);

    /**
     * Check that the bytes form well-formed UTF-8
     */
    static bool isValidUtf8(const std::string& bytes);

    /**
     * Extract the uploaded file from a fully buffered request
     * @param request Raw request: HTTP headers followed by the multipart body
     * @return File name and content
     * @throws UploadError on encoding or structural failure
     */
    static ReceivedFile extract(const std::string& request);

private:
    static void trim(std::string& s);
    static void toLower(std::string& s);
};

} // namespace http
} // namespace bookdrop
