#include "offset_index.hpp"
#include "archive_errors.hpp"
#include "stream_decoder.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

bool parseOffset(const std::string& text, uint64_t& out) {
    if (text.empty()) return false;
    uint64_t value = 0;
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    for (char c : text) {
        if (!isdigit(static_cast<unsigned char>(c))) return false;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (max - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

void checkSqlite(int rc, sqlite3* db, const std::string& what) {
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw std::runtime_error(what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
    }
}

void execSql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw std::runtime_error(std::string("sqlite: ") + sql + ": " + msg);
    }
}

bool isCompressedListing(const std::string& path) {
    std::string lower = Utils::toLower(path);
    return Utils::endsWith(lower, ".bz2") || Utils::endsWith(lower, ".gz");
}

void addListingLine(std::string line, std::vector<IndexEntry>& entries, ListingStats& stats) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) return;
    stats.lines++;
    IndexEntry entry;
    if (parseListingLine(line, entry)) {
        entries.push_back(std::move(entry));
    } else {
        stats.malformed++;
        if (stats.malformed <= 10) {
            std::cerr << "Warning: malformed listing line " << stats.lines << ": " << line << std::endl;
        }
    }
}

void readPlainListing(std::istream& in, std::vector<IndexEntry>& entries, ListingStats& stats) {
    std::string line;
    while (std::getline(in, line)) addListingLine(line, entries, stats);
}

void readCompressedListing(std::istream& in, ArchiveCodec codec, size_t chunkSize,
                           std::vector<IndexEntry>& entries, ListingStats& stats) {
    std::unique_ptr<BlockDecoder> decoder = BlockDecoder::create(codec);
    std::string partial;
    DecodeSink sink = [&](const char* data, size_t size) {
        partial.append(data, size);
        size_t start = 0;
        size_t nl;
        while ((nl = partial.find('\n', start)) != std::string::npos) {
            addListingLine(partial.substr(start, nl - start), entries, stats);
            start = nl + 1;
        }
        partial.erase(0, start);
        return true;
    };

    std::vector<char> buf(std::max<size_t>(chunkSize, 1));
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        size_t got = static_cast<size_t>(in.gcount());
        if (got == 0) break;
        if (!decoder->decode(buf.data(), got, sink)) break;
    }
    addListingLine(partial, entries, stats);
    stats.truncated = !decoder->complete();
}

const char kSelectByTitle[] =
    "SELECT first_byte, page_id, title, last_byte FROM pages WHERE title = ? ORDER BY rowid";
const char kSelectById[] =
    "SELECT first_byte, page_id, title, last_byte FROM pages WHERE page_id = ? ORDER BY rowid";

} // namespace

bool parseListingLine(const std::string& line, IndexEntry& entry) {
    size_t first = line.find(':');
    if (first == std::string::npos) return false;
    size_t second = line.find(':', first + 1);
    if (second == std::string::npos) return false;

    uint64_t start = 0;
    if (!parseOffset(line.substr(0, first), start)) return false;
    std::string id = line.substr(first + 1, second - first - 1);
    if (id.empty()) return false;

    std::string title = line.substr(second + 1);
    if (!title.empty() && title.back() == '\r') title.pop_back();
    if (title.empty()) return false;

    entry.start_offset = start;
    entry.document_id = std::move(id);
    entry.title = std::move(title);
    entry.end_offset = IndexEntry::kReadToEnd;
    return true;
}

bool readListing(const std::string& path, std::vector<IndexEntry>& entries, ListingStats& stats,
                 size_t chunkSize) {
    if (!isCompressedListing(path)) {
        std::ifstream in(path);
        if (!in.is_open()) return false;
        readPlainListing(in, entries, stats);
        return true;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    readCompressedListing(in, codecForPath(path), chunkSize, entries, stats);
    if (stats.truncated) {
        std::cerr << "Warning: " << path << " ended inside a compressed stream" << std::endl;
    }
    return true;
}

void assignEndOffsets(std::vector<IndexEntry>& entries) {
    std::vector<uint64_t> starts;
    starts.reserve(entries.size());
    for (const auto& e : entries) starts.push_back(e.start_offset);
    std::sort(starts.begin(), starts.end());
    starts.erase(std::unique(starts.begin(), starts.end()), starts.end());

    for (auto& e : entries) {
        auto next = std::upper_bound(starts.begin(), starts.end(), e.start_offset);
        e.end_offset = next == starts.end() ? IndexEntry::kReadToEnd : *next;
    }
}

// MemoryOffsetIndex

MemoryOffsetIndex::MemoryOffsetIndex(std::vector<IndexEntry> entries) : entries_(std::move(entries)) {
    for (size_t i = 0; i < entries_.size(); ++i) {
        byTitle_[entries_[i].title].push_back(i);
        byId_[entries_[i].document_id].push_back(i);
    }
}

std::vector<IndexEntry> MemoryOffsetIndex::lookup(const std::string& title) const {
    auto it = byTitle_.find(title);
    if (it == byTitle_.end()) throw ArticleNotFoundError(title);
    std::vector<IndexEntry> out;
    for (size_t i : it->second) out.push_back(entries_[i]);
    return out;
}

std::vector<IndexEntry> MemoryOffsetIndex::lookupById(const std::string& documentId) const {
    std::vector<IndexEntry> out;
    auto it = byId_.find(documentId);
    if (it == byId_.end()) return out;
    for (size_t i : it->second) out.push_back(entries_[i]);
    return out;
}

// SqliteOffsetIndex

SqliteOffsetIndex::SqliteOffsetIndex(const std::string& dbPath) {
    if (!std::ifstream(dbPath).good()) {
        throw ConstructionError("Index database does not exist: " + dbPath);
    }
    int rc = sqlite3_open_v2(dbPath.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        close();
        throw ConstructionError("Could not open index database " + dbPath + ": " + msg);
    }
    if (sqlite3_prepare_v2(db_, kSelectByTitle, -1, &byTitle_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, kSelectById, -1, &byId_, nullptr) != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(db_);
        close();
        throw ConstructionError("Index database " + dbPath + " has no usable pages table: " + msg);
    }
}

SqliteOffsetIndex::~SqliteOffsetIndex() {
    close();
}

void SqliteOffsetIndex::close() {
    sqlite3_finalize(byTitle_);
    sqlite3_finalize(byId_);
    byTitle_ = nullptr;
    byId_ = nullptr;
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::vector<IndexEntry> SqliteOffsetIndex::query(sqlite3_stmt* stmt, const std::string& key) const {
    std::vector<IndexEntry> out;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    checkSqlite(sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT),
                db_, "sqlite: bind");

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        IndexEntry e;
        e.start_offset = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        const unsigned char* id = sqlite3_column_text(stmt, 1);
        const unsigned char* title = sqlite3_column_text(stmt, 2);
        e.document_id = id ? reinterpret_cast<const char*>(id) : "";
        e.title = title ? reinterpret_cast<const char*>(title) : "";
        sqlite3_int64 last = sqlite3_column_int64(stmt, 3);
        e.end_offset = last < 0 ? IndexEntry::kReadToEnd : static_cast<uint64_t>(last);
        out.push_back(std::move(e));
    }
    checkSqlite(rc, db_, "sqlite: step");
    sqlite3_reset(stmt);
    return out;
}

std::vector<IndexEntry> SqliteOffsetIndex::lookup(const std::string& title) const {
    std::vector<IndexEntry> out = query(byTitle_, title);
    if (out.empty()) throw ArticleNotFoundError(title);
    return out;
}

std::vector<IndexEntry> SqliteOffsetIndex::lookupById(const std::string& documentId) const {
    return query(byId_, documentId);
}

void SqliteOffsetIndex::build(const std::vector<IndexEntry>& entries, const std::string& dbPath) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open(dbPath.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        throw std::runtime_error("Could not create index database " + dbPath + ": " + msg);
    }

    sqlite3_stmt* insert = nullptr;
    try {
        execSql(db, "DROP TABLE IF EXISTS pages;");
        execSql(db, "CREATE TABLE pages (first_byte INTEGER, page_id TEXT, title TEXT, last_byte INTEGER);");
        execSql(db, "BEGIN TRANSACTION;");

        checkSqlite(sqlite3_prepare_v2(db,
                        "INSERT INTO pages (first_byte, page_id, title, last_byte) VALUES (?, ?, ?, ?)",
                        -1, &insert, nullptr),
                    db, "sqlite: prepare insert");
        for (const auto& e : entries) {
            sqlite3_reset(insert);
            sqlite3_bind_int64(insert, 1, static_cast<sqlite3_int64>(e.start_offset));
            sqlite3_bind_text(insert, 2, e.document_id.c_str(), static_cast<int>(e.document_id.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(insert, 3, e.title.c_str(), static_cast<int>(e.title.size()), SQLITE_TRANSIENT);
            sqlite3_bind_int64(insert, 4, e.readsToEnd() ? -1 : static_cast<sqlite3_int64>(e.end_offset));
            checkSqlite(sqlite3_step(insert), db, "sqlite: insert");
        }
        sqlite3_finalize(insert);
        insert = nullptr;

        execSql(db, "COMMIT;");
        execSql(db, "CREATE INDEX pages_id_idx ON pages (page_id);");
        execSql(db, "CREATE INDEX pages_title_idx ON pages (title);");
    } catch (const std::exception&) {
        sqlite3_finalize(insert);
        sqlite3_close(db);
        throw;
    }
    sqlite3_close(db);
}
