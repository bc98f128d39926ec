#pragma once

#include <sqlite3.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

struct IndexEntry {
    // end_offset value meaning "read to the end of the archive"
    static constexpr uint64_t kReadToEnd = std::numeric_limits<uint64_t>::max();

    std::string title;
    std::string document_id;
    uint64_t start_offset = 0;
    uint64_t end_offset = kReadToEnd;

    bool readsToEnd() const { return end_offset == kReadToEnd; }
};

// Parses one "byte:id:title" line of the dump listing. Only the first two
// colons separate fields, titles may contain more. end_offset is left at
// the sentinel; see assignEndOffsets.
bool parseListingLine(const std::string& line, IndexEntry& entry);

struct ListingStats {
    size_t lines = 0;
    size_t malformed = 0;
    // Compressed listing ended inside a stream
    bool truncated = false;
};

// Reads a dump listing into entries, one parseListingLine per non-empty
// line. Files ending in .bz2 or .gz are decoded chunkSize bytes at a time,
// anything else is read as text. Malformed lines are counted and skipped.
// Returns false when the file cannot be opened.
bool readListing(const std::string& path, std::vector<IndexEntry>& entries, ListingStats& stats,
                 size_t chunkSize = 1 << 20);

// Sets each entry's end_offset to the next distinct start offset. Entries
// in the last block keep the read-to-end sentinel.
void assignEndOffsets(std::vector<IndexEntry>& entries);

// Read contract of the offset index. Results come back in row order.
class OffsetIndex {
public:
    virtual ~OffsetIndex() = default;

    // Throws ArticleNotFoundError when nothing matches.
    virtual std::vector<IndexEntry> lookup(const std::string& title) const = 0;
    virtual std::vector<IndexEntry> lookupById(const std::string& documentId) const = 0;
};

class MemoryOffsetIndex : public OffsetIndex {
public:
    explicit MemoryOffsetIndex(std::vector<IndexEntry> entries);

    std::vector<IndexEntry> lookup(const std::string& title) const override;
    std::vector<IndexEntry> lookupById(const std::string& documentId) const override;

    size_t size() const { return entries_.size(); }

private:
    std::vector<IndexEntry> entries_;
    std::unordered_map<std::string, std::vector<size_t>> byTitle_;
    std::unordered_map<std::string, std::vector<size_t>> byId_;
};

// SQLite backed index: table pages(first_byte, page_id, title, last_byte)
// with last_byte = -1 for the read-to-end sentinel.
class SqliteOffsetIndex : public OffsetIndex {
public:
    // Throws ConstructionError if the database or its table is missing.
    explicit SqliteOffsetIndex(const std::string& dbPath);
    ~SqliteOffsetIndex() override;

    SqliteOffsetIndex(const SqliteOffsetIndex&) = delete;
    SqliteOffsetIndex& operator=(const SqliteOffsetIndex&) = delete;

    std::vector<IndexEntry> lookup(const std::string& title) const override;
    std::vector<IndexEntry> lookupById(const std::string& documentId) const override;

    // Replaces the pages table of dbPath with entries, then builds the
    // title and id indexes.
    static void build(const std::vector<IndexEntry>& entries, const std::string& dbPath);

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* byTitle_ = nullptr;
    sqlite3_stmt* byId_ = nullptr;

    std::vector<IndexEntry> query(sqlite3_stmt* stmt, const std::string& key) const;
    void close();
};
