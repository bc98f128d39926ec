#pragma once

#include "offset_index.hpp"
#include "stream_decoder.hpp"

#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

struct ExtractedDocument {
    std::string document_id;
    std::string raw_text;
};

// Small LRU of recently retrieved documents keyed by title.
class RecentDocuments {
public:
    explicit RecentDocuments(size_t capacity) : capacity_(capacity) {}

    const ExtractedDocument* find(const std::string& title);
    void put(const std::string& title, const ExtractedDocument& doc);

    size_t size() const { return order_.size(); }
    size_t capacity() const { return capacity_; }

private:
    using Entry = std::pair<std::string, ExtractedDocument>;
    size_t capacity_;
    std::list<Entry> order_; // most recent first
    std::unordered_map<std::string, std::list<Entry>::iterator> byTitle_;
};

// Where the crawl gets its documents from.
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    // Throws ArticleNotFoundError.
    virtual IndexEntry resolve(const std::string& title) const = 0;
    // Throws ArchiveError subclasses.
    virtual ExtractedDocument retrieve(const IndexEntry& entry) = 0;
};

// Pulls single <page> documents out of a multistream archive.
//
// Each call opens its own handle on the archive, seeks to the indexed
// block, decodes only that span and stops decoding as soon as the scanner
// has the target page.
class ArchiveExtractor : public DocumentSource {
public:
    // Throws ConstructionError if the archive file does not exist.
    ArchiveExtractor(const std::string& archivePath, std::shared_ptr<const OffsetIndex> index,
                     size_t recentCapacity = 64);

    // First index entry for title. Duplicate titles resolve to the first
    // row and log a warning. Throws ArticleNotFoundError.
    IndexEntry resolve(const std::string& title) const override;

    // Throws ArticleNotFoundError, CorruptArchiveError or ScanNotFoundError.
    ExtractedDocument retrieve(const std::string& title);
    ExtractedDocument retrieve(const IndexEntry& entry) override;

    ArchiveCodec codec() const { return codec_; }
    const std::string& archivePath() const { return archivePath_; }
    const OffsetIndex& index() const { return *index_; }

private:
    std::string archivePath_;
    ArchiveCodec codec_;
    std::shared_ptr<const OffsetIndex> index_;
    RecentDocuments recent_;

    static constexpr size_t kReadChunk = 1 << 20;
};
