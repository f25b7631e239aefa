#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace bookdrop {
namespace http {

// What a connection asked for, decided from its request head
enum class RequestKind {
    FORM,
    OPTIONS,
    UPLOAD,
};

/**
 * What the classifier learned from the start of a request
 */
struct RequestHead {
    RequestKind kind = RequestKind::FORM;
    std::string boundary;                      // empty when not seen yet
    std::optional<std::size_t> contentLength;  // declared body length, if seen
};

/**
 * Heuristic request classifier. It looks for substrings in the first bytes
 * of a connection instead of parsing the request line and headers, which
 * is enough for the bundled upload page and ordinary browsers.
 */
class RequestClassifier {
public:
    static RequestHead classify(const std::string& head);

    // True once enough bytes are buffered to classify without guessing
    static bool headComplete(const std::string& buffered);

private:
    static bool containsIcase(const std::string& haystack, const std::string& needle);
};

} // namespace http
} // namespace bookdrop
