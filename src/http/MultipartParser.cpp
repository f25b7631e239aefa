#include "bookdrop/http/MultipartParser.hpp"
#include <cctype>
#include <algorithm>

namespace bookdrop {
namespace http {

namespace {
    const std::string kHeaderEnd = "\r\n\r\n";
    const std::string kFileNameMarker = "filename=\"";
}

void MultipartParser::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void MultipartParser::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

std::string MultipartParser::extractBoundary(const std::string& head) {
    auto start = head.find("boundary=");
    if (start == std::string::npos) {
        return std::string();
    }
    start += 9;

    // The token runs to the end of the header line or the next parameter
    size_t end = head.find_first_of(";\r\n", start);
    std::string boundary = head.substr(start, end == std::string::npos ? std::string::npos : end - start);
    trim(boundary);

    // Remove surrounding quotes
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.size() - 2);
    }
    return boundary;
}

std::optional<std::string> MultipartParser::extractFileName(const std::string& text) {
    auto start = text.find(kFileNameMarker);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += kFileNameMarker.size();

    auto end = text.find('"', start);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return text.substr(start, end - start);
}

std::optional<std::size_t> MultipartParser::extractContentLength(const std::string& head) {
    std::string lowered = head;
    toLower(lowered);

    const std::string name = "content-length:";
    auto pos = lowered.find(name);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos += name.size();

    auto eol = head.find("\r\n", pos);
    std::string value = head.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
    trim(value);
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool MultipartParser::isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        size_t extra;
        unsigned int min;
        unsigned int cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1; min = 0x80; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2; min = 0x800; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3; min = 0x10000; cp = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

ReceivedFile MultipartParser::extract(const std::string& request) {
    if (!isValidUtf8(request)) {
        throw UploadError(UploadError::Kind::UnsupportedEncoding, "Unsupported file encoding");
    }

    auto headerEnd = request.find(kHeaderEnd);
    if (headerEnd == std::string::npos) {
        throw UploadError(UploadError::Kind::MissingBoundary, "Could not find multipart boundary");
    }
    const std::string boundary = extractBoundary(request.substr(0, headerEnd));
    if (boundary.empty()) {
        throw UploadError(UploadError::Kind::MissingBoundary, "Could not find multipart boundary");
    }
    const size_t bodyStart = headerEnd + kHeaderEnd.size();

    // File name lives in the part headers
    auto nameStart = request.find(kFileNameMarker, bodyStart);
    if (nameStart == std::string::npos) {
        throw UploadError(UploadError::Kind::MissingFileName, "Could not parse file name");
    }
    nameStart += kFileNameMarker.size();
    auto nameEnd = request.find('"', nameStart);
    if (nameEnd == std::string::npos) {
        throw UploadError(UploadError::Kind::MissingFileName, "Could not parse file name");
    }

    // Blank line closing the part headers
    auto partHeadersEnd = request.find(kHeaderEnd, nameEnd);
    if (partHeadersEnd == std::string::npos) {
        throw UploadError(UploadError::Kind::MissingTerminator, "Could not parse file content");
    }
    const size_t contentStart = partHeadersEnd + kHeaderEnd.size();

    const std::string dash = "--" + boundary;
    auto closing = request.find(dash + "--", contentStart);
    if (closing == std::string::npos) {
        throw UploadError(UploadError::Kind::MissingTerminator, "Could not parse file content");
    }

    // The CRLF before a delimiter belongs to the delimiter, not the content
    size_t contentEnd = closing;
    auto delimiter = request.find("\r\n" + dash, contentStart);
    if (delimiter != std::string::npos && delimiter <= closing) {
        contentEnd = delimiter;
    }

    ReceivedFile file;
    file.fileName = request.substr(nameStart, nameEnd - nameStart);
    file.content = request.substr(contentStart, contentEnd - contentStart);
    return file;
}

} // namespace http
} // namespace bookdrop
