#include "bookdrop/library/BookLibrary.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace bookdrop {
namespace library {

namespace {
    const char* kMetadataFile = "library.json";

    bool hasBookExtension(const std::string& name) {
        std::string lowered = name;
        for (char& c : lowered) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        auto endsWith = [&lowered](const std::string& suffix) {
            return lowered.size() > suffix.size() &&
                   lowered.compare(lowered.size() - suffix.size(), suffix.size(), suffix) == 0;
        };
        return endsWith(".txt") || endsWith(".md");
    }

    std::string titleOf(const std::string& fileName) {
        size_t dotPos = fileName.find_last_of('.');
        return dotPos == std::string::npos ? fileName : fileName.substr(0, dotPos);
    }
}

BookLibrary::BookLibrary(const std::string& basePath)
    : basePath_(basePath) {
    ensureStorageDirectory();
}

std::string BookLibrary::sanitizeFileName(const std::string& originalName) {
    std::string name = originalName;

    // Remove any path components
    size_t lastSlash = name.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        name = name.substr(lastSlash + 1);
    }
    name.erase(std::remove_if(name.begin(), name.end(),
                              [](unsigned char c) { return c < 0x20 || c == 0x7F; }),
               name.end());

    if (name.empty() || name == "." || name == "..") {
        name = "book";
    }
    if (!hasBookExtension(name)) {
        name += ".txt";
    }
    return name;
}

BookEntry BookLibrary::importBook(const std::string& fileName, const std::string& content) {
    const std::string storedName = sanitizeFileName(fileName);
    const std::string fullPath = getFullPath(storedName);
    std::cout << "Importing book '" << fileName << "' as " << fullPath << std::endl;

    ensureStorageDirectory();
    if (std::filesystem::exists(fullPath)) {
        std::cout << "Replacing existing book: " << storedName << std::endl;
    }

    std::ofstream outFile(fullPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        std::string error = "Failed to create file: " + fullPath + " (" + strerror(errno) + ")";
        std::cerr << error << std::endl;
        throw std::runtime_error(error);
    }
    outFile.write(content.data(), static_cast<std::streamsize>(content.size()));
    outFile.close();
    if (!outFile) {
        throw std::runtime_error("Failed to write file: " + fullPath);
    }

    BookEntry entry{titleOf(storedName), storedName, currentTimestamp()};

    nlohmann::json metadata = loadMetadata();
    nlohmann::json& books = metadata["books"];
    for (auto it = books.begin(); it != books.end(); ++it) {
        if ((*it).value("fileName", "") == storedName) {
            books.erase(it);
            break;
        }
    }
    books.push_back({
        {"title", entry.title},
        {"fileName", entry.fileName},
        {"importedAt", entry.importedAt}
    });
    saveMetadata(metadata);

    std::cout << "Book saved: " << storedName << " (" << content.size() << " bytes)" << std::endl;
    return entry;
}

std::vector<BookEntry> BookLibrary::listBooks() const {
    std::vector<BookEntry> books;
    if (!std::filesystem::exists(basePath_)) {
        return books;
    }

    const nlohmann::json metadata = loadMetadata();

    for (const auto& item : std::filesystem::directory_iterator(basePath_)) {
        if (!item.is_regular_file()) continue;
        const std::string name = item.path().filename().string();
        if (name.empty() || name.front() == '.' || !hasBookExtension(name)) continue;

        BookEntry entry{titleOf(name), name, ""};
        for (const auto& book : metadata["books"]) {
            if (book.value("fileName", "") == name) {
                entry.importedAt = book.value("importedAt", "");
                break;
            }
        }
        books.push_back(entry);
    }

    std::sort(books.begin(), books.end(),
              [](const BookEntry& a, const BookEntry& b) { return a.fileName < b.fileName; });
    return books;
}

std::string BookLibrary::readBook(const std::string& fileName) const {
    std::ifstream inFile(getFullPath(sanitizeFileName(fileName)), std::ios::binary);
    if (!inFile) {
        throw std::runtime_error("Book not found: " + fileName);
    }

    std::string content((std::istreambuf_iterator<char>(inFile)),
                        std::istreambuf_iterator<char>());
    return content;
}

bool BookLibrary::deleteBook(const std::string& fileName) {
    const std::string storedName = sanitizeFileName(fileName);
    std::error_code ec;
    bool removed = std::filesystem::remove(getFullPath(storedName), ec);
    if (ec) {
        std::cerr << "Failed to delete book " << storedName << ": " << ec.message() << std::endl;
        return false;
    }

    nlohmann::json metadata = loadMetadata();
    nlohmann::json& books = metadata["books"];
    auto before = books.size();
    for (auto it = books.begin(); it != books.end(); ++it) {
        if ((*it).value("fileName", "") == storedName) {
            books.erase(it);
            break;
        }
    }
    if (books.size() != before) {
        saveMetadata(metadata);
    }
    return removed;
}

std::string BookLibrary::getFullPath(const std::string& fileName) const {
    return basePath_ + "/" + fileName;
}

void BookLibrary::ensureStorageDirectory() const {
    std::filesystem::create_directories(basePath_);
}

nlohmann::json BookLibrary::loadMetadata() const {
    nlohmann::json empty;
    empty["books"] = nlohmann::json::array();

    std::ifstream file(getFullPath(kMetadataFile));
    if (!file.is_open()) {
        return empty;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_object() || !j.contains("books") || !j["books"].is_array()) {
            std::cerr << "Invalid library metadata: 'books' array missing. Using empty metadata." << std::endl;
            return empty;
        }
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Library metadata parse error: " << e.what() << ". Using empty metadata." << std::endl;
        return empty;
    }
}

void BookLibrary::saveMetadata(const nlohmann::json& metadata) const {
    std::ofstream file(getFullPath(kMetadataFile), std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open library metadata for writing: " + getFullPath(kMetadataFile));
    }
    file << metadata.dump(4);
}

std::string BookLibrary::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm tm = *std::localtime(&in_time_t);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace library
} // namespace bookdrop
