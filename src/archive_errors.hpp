#pragma once

#include <stdexcept>
#include <string>

// Base of every failure raised while resolving or extracting a document.
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& what) : std::runtime_error(what) {}
};

// Title absent from the offset index.
class ArticleNotFoundError : public ArchiveError {
public:
    explicit ArticleNotFoundError(const std::string& title)
        : ArchiveError("Article not found in index: " + title), title_(title) {}

    const std::string& title() const { return title_; }

private:
    std::string title_;
};

// The compressed span could not be decoded.
class CorruptArchiveError : public ArchiveError {
public:
    explicit CorruptArchiveError(const std::string& what) : ArchiveError(what) {}
};

// The span decoded fine but no <page> carried the expected id.
class ScanNotFoundError : public ArchiveError {
public:
    ScanNotFoundError(const std::string& title, const std::string& documentId)
        : ArchiveError("Document " + documentId + " (" + title + ") not present in its indexed block"),
          documentId_(documentId) {}

    const std::string& documentId() const { return documentId_; }

private:
    std::string documentId_;
};

// Archive or index missing at startup.
class ConstructionError : public ArchiveError {
public:
    explicit ConstructionError(const std::string& what) : ArchiveError(what) {}
};
