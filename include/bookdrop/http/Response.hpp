#pragma once

#include <string>
#include <utility>
#include <vector>

namespace bookdrop {
namespace http {

/**
 * HTTP Response object. Every response closes the connection.
 */
struct Response {
    int status = 200;
    std::string contentType = "text/html; charset=utf-8";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Status line, headers and body as sent on the wire
    std::string serialize() const;

    // GET: the upload page
    static Response uploadForm();

    // OPTIONS: CORS preflight, no body
    static Response preflight();

    static Response success(const std::string& fileName);

    static Response failure(const std::string& message);
};

const char* statusText(int status);

// Escape text for inclusion in an HTML page
std::string escapeHtml(const std::string& text);

} // namespace http
} // namespace bookdrop
