#include "bookdrop/http/Request.hpp"
#include "bookdrop/http/MultipartParser.hpp"

#include <algorithm>
#include <cctype>

namespace bookdrop {
namespace http {

bool RequestClassifier::containsIcase(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

bool RequestClassifier::headComplete(const std::string& buffered) {
    return buffered.find("\r\n\r\n") != std::string::npos;
}

RequestHead RequestClassifier::classify(const std::string& head) {
    RequestHead result;

    if (head.rfind("OPTIONS", 0) == 0) {
        result.kind = RequestKind::OPTIONS;
        return result;
    }

    if (containsIcase(head, "Content-Type: multipart/form-data")) {
        result.kind = RequestKind::UPLOAD;

        // A cut-off header line could yield a truncated value, so only a
        // complete header block is trusted here
        auto headerEnd = head.find("\r\n\r\n");
        if (headerEnd != std::string::npos) {
            const std::string headers = head.substr(0, headerEnd);
            result.boundary = MultipartParser::extractBoundary(headers);
            result.contentLength = MultipartParser::extractContentLength(headers);
        }
        return result;
    }

    result.kind = RequestKind::FORM;
    return result;
}

} // namespace http
} // namespace bookdrop
