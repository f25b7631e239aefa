#include "bookdrop/http/Response.hpp"

#include <sstream>

namespace bookdrop {
namespace http {

namespace {

const char* kUploadPage = R"HTML(<!DOCTYPE html>
<html>
<head>
    <meta charset="utf-8">
    <meta name="viewport" content="width=device-width, initial-scale=1">
    <title>WiFi Transfer</title>
    <style>
        body {
            font-family: -apple-system, BlinkMacSystemFont, sans-serif;
            max-width: 600px;
            margin: 0 auto;
            padding: 20px;
            text-align: center;
        }
        .upload-form {
            border: 2px dashed #ccc;
            border-radius: 10px;
            padding: 20px;
            margin: 20px 0;
        }
        .file-input { display: none; }
        .upload-button {
            background: #007AFF;
            color: white;
            padding: 10px 20px;
            border: none;
            border-radius: 5px;
            font-size: 16px;
            cursor: pointer;
        }
        .file-label { display: block; margin: 10px 0; color: #666; }
        #selected-file { margin: 10px 0; color: #333; }
        .error { color: #FF3B30; margin: 10px 0; display: none; }
        .progress {
            width: 100%;
            height: 8px;
            background: #E5E5EA;
            border-radius: 4px;
            overflow: hidden;
            margin: 20px 0;
            display: none;
        }
        .progress-bar { width: 0%; height: 100%; background: #007AFF; }
        #progress-text { color: #666; }
    </style>
</head>
<body>
    <h1>WiFi Transfer</h1>
    <div class="upload-form">
        <form id="upload-form" action="/upload" method="post" enctype="multipart/form-data">
            <label class="file-label">Supported format: TXT</label>
            <input type="file" name="book" accept=".txt" class="file-input" id="file-input" onchange="updateFileName()">
            <button type="button" class="upload-button" onclick="document.getElementById('file-input').click()">Choose file</button>
            <div id="selected-file"></div>
            <div class="error" id="error-message">Please choose a valid text file</div>
            <div class="progress" id="progress"><div class="progress-bar" id="progress-bar"></div></div>
            <div id="progress-text"></div>
            <button type="submit" class="upload-button" id="submit-button" style="margin-top: 10px;">Upload</button>
        </form>
    </div>
    <script>
        function selectedFile() {
            const input = document.getElementById('file-input');
            return input.files.length > 0 ? input.files[0] : null;
        }

        function isValid(file) {
            return file !== null && file.name.toLowerCase().endsWith('.txt');
        }

        function updateFileName() {
            const file = selectedFile();
            document.getElementById('selected-file').textContent = file ? file.name : '';
            document.getElementById('error-message').style.display =
                file && !isValid(file) ? 'block' : 'none';
        }

        function showPage(html) {
            document.open();
            document.write(html);
            document.close();
        }

        document.getElementById('upload-form').addEventListener('submit', function (event) {
            event.preventDefault();
            const file = selectedFile();
            if (!isValid(file)) {
                document.getElementById('error-message').style.display = 'block';
                return;
            }

            const data = new FormData();
            data.append('book', file, file.name);

            const progress = document.getElementById('progress');
            const bar = document.getElementById('progress-bar');
            const text = document.getElementById('progress-text');
            progress.style.display = 'block';
            document.getElementById('submit-button').disabled = true;

            const xhr = new XMLHttpRequest();
            xhr.open('POST', '/upload', true);
            xhr.upload.onprogress = function (e) {
                if (e.lengthComputable) {
                    const percent = Math.round(e.loaded * 100 / e.total);
                    bar.style.width = percent + '%';
                    text.textContent = percent + '%';
                }
            };
            xhr.onload = function () { showPage(xhr.responseText); };
            xhr.onerror = function () {
                text.textContent = 'Upload failed, please try again';
                document.getElementById('submit-button').disabled = false;
            };
            xhr.send(data);
        });
    </script>
</body>
</html>
)HTML";

const char* kPageStyle = R"HTML(    <style>
        body {
            font-family: -apple-system, BlinkMacSystemFont, sans-serif;
            max-width: 600px;
            margin: 0 auto;
            padding: 20px;
            text-align: center;
        }
        .icon { font-size: 48px; margin: 20px 0; }
        .success { color: #34C759; }
        .failure { color: #FF3B30; }
        .detail { color: #666; margin: 10px 0; }
        .back-button {
            display: inline-block;
            background: #007AFF;
            color: white;
            padding: 10px 20px;
            border-radius: 5px;
            text-decoration: none;
            margin-top: 20px;
        }
    </style>
)HTML";

std::string resultPage(const std::string& title, const std::string& iconClass, const std::string& icon,
                       const std::string& detail, int redirectMs) {
    std::ostringstream page;
    page << "<!DOCTYPE html>\n<html>\n<head>\n"
         << "    <meta charset=\"utf-8\">\n"
         << "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
         << "    <title>" << title << "</title>\n"
         << kPageStyle
         << "</head>\n<body>\n"
         << "    <div class=\"icon " << iconClass << "\">" << icon << "</div>\n"
         << "    <h1>" << title << "</h1>\n"
         << "    <p class=\"detail\">" << detail << "</p>\n"
         << "    <a href=\"/\" class=\"back-button\">Back</a>\n"
         << "    <script>setTimeout(function() { window.location.href = '/'; }, " << redirectMs << ");</script>\n"
         << "</body>\n</html>\n";
    return page.str();
}

} // namespace

const char* statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        default:  return "Unknown";
    }
}

std::string escapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string Response::serialize() const {
    std::ostringstream response;
    response << "HTTP/1.1 " << status << " " << statusText(status) << "\r\n";
    if (!contentType.empty()) {
        response << "Content-Type: " << contentType << "\r\n";
    }
    if (status != 204) {
        response << "Content-Length: " << body.size() << "\r\n";
    }
    for (const auto& header : headers) {
        response << header.first << ": " << header.second << "\r\n";
    }
    response << "Connection: close\r\n\r\n";
    response << body;
    return response.str();
}

Response Response::uploadForm() {
    Response r;
    r.headers = {{"Access-Control-Allow-Origin", "*"}};
    r.body = kUploadPage;
    return r;
}

Response Response::preflight() {
    Response r;
    r.status = 204;
    r.contentType.clear();
    r.headers = {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "POST, GET, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"},
    };
    return r;
}

Response Response::success(const std::string& fileName) {
    Response r;
    r.headers = {{"Access-Control-Allow-Origin", "*"}};
    r.body = resultPage("Upload complete", "success", "&#10003;",
                        "File name: " + escapeHtml(fileName), 2000);
    return r;
}

Response Response::failure(const std::string& message) {
    Response r;
    r.status = 400;
    r.headers = {{"Access-Control-Allow-Origin", "*"}};
    r.body = resultPage("Upload failed", "failure", "&#10007;", escapeHtml(message), 3000);
    return r;
}

} // namespace http
} // namespace bookdrop
