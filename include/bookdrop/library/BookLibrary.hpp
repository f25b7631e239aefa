#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace bookdrop {
namespace library {

struct BookEntry {
    std::string title;       // file name without extension
    std::string fileName;
    std::string importedAt;  // empty for files not imported through the library
};

class BookLibrary {
public:
    explicit BookLibrary(const std::string& basePath = "library");

    // Stores the book (replacing a same-named one) and records it in the sidecar
    BookEntry importBook(const std::string& fileName, const std::string& content);

    // Books present on disk, sorted by file name
    std::vector<BookEntry> listBooks() const;

    // Reads a stored book; throws std::runtime_error if missing
    std::string readBook(const std::string& fileName) const;

    // Removes a stored book and its sidecar entry
    bool deleteBook(const std::string& fileName);

    std::string getFullPath(const std::string& fileName) const;

    void ensureStorageDirectory() const;

    // Name a book is stored under: path components removed, .txt/.md enforced
    static std::string sanitizeFileName(const std::string& originalName);

private:
    std::string basePath_;

    nlohmann::json loadMetadata() const;
    void saveMetadata(const nlohmann::json& metadata) const;
    static std::string currentTimestamp();
};

} // namespace library
} // namespace bookdrop
