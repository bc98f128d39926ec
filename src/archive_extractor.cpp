#include "archive_extractor.hpp"
#include "archive_errors.hpp"
#include "document_scanner.hpp"
#include "utils.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <vector>

// RecentDocuments

const ExtractedDocument* RecentDocuments::find(const std::string& title) {
    auto it = byTitle_.find(title);
    if (it == byTitle_.end()) return nullptr;
    order_.splice(order_.begin(), order_, it->second);
    return &it->second->second;
}

void RecentDocuments::put(const std::string& title, const ExtractedDocument& doc) {
    if (capacity_ == 0) return;
    auto it = byTitle_.find(title);
    if (it != byTitle_.end()) {
        it->second->second = doc;
        order_.splice(order_.begin(), order_, it->second);
        return;
    }
    order_.emplace_front(title, doc);
    byTitle_[title] = order_.begin();
    if (order_.size() > capacity_) {
        byTitle_.erase(order_.back().first);
        order_.pop_back();
    }
}

// ArchiveExtractor

ArchiveExtractor::ArchiveExtractor(const std::string& archivePath, std::shared_ptr<const OffsetIndex> index,
                                   size_t recentCapacity)
    : archivePath_(archivePath),
      codec_(codecForPath(archivePath)),
      index_(std::move(index)),
      recent_(recentCapacity) {
    if (!std::ifstream(archivePath_, std::ios::binary).good()) {
        throw ConstructionError("Archive does not exist: " + archivePath_);
    }
    if (!index_) {
        throw ConstructionError("No offset index given for archive " + archivePath_);
    }
}

IndexEntry ArchiveExtractor::resolve(const std::string& title) const {
    std::vector<IndexEntry> matches = index_->lookup(title);
    if (matches.size() > 1) {
        std::cerr << "Warning: " << matches.size() << " index entries for title \"" << title
                  << "\", using id " << matches.front().document_id << std::endl;
    }
    return matches.front();
}

ExtractedDocument ArchiveExtractor::retrieve(const std::string& title) {
    return retrieve(resolve(title));
}

ExtractedDocument ArchiveExtractor::retrieve(const IndexEntry& entry) {
    const ExtractedDocument* cached = recent_.find(entry.title);
    if (cached && cached->document_id == entry.document_id) {
        return *cached;
    }

    if (!entry.readsToEnd() && entry.end_offset <= entry.start_offset) {
        throw CorruptArchiveError("Empty or inverted span [" + std::to_string(entry.start_offset) + ", " +
                                  std::to_string(entry.end_offset) + ") for " + entry.title);
    }

    Utils::ScopedTimer t("Decompress+Scan");

    std::ifstream file(archivePath_, std::ios::binary);
    if (!file.is_open()) {
        throw CorruptArchiveError("Could not open archive " + archivePath_);
    }
    file.seekg(static_cast<std::streamoff>(entry.start_offset), std::ios::beg);
    if (!file) {
        throw CorruptArchiveError("Offset " + std::to_string(entry.start_offset) + " lies beyond the end of " +
                                  archivePath_);
    }

    std::unique_ptr<BlockDecoder> decoder = BlockDecoder::create(codec_);
    DocumentScanner scanner(entry.document_id);
    DecodeSink sink = [&scanner](const char* data, size_t size) {
        return scanner.feed(std::string_view(data, size));
    };

    uint64_t remaining = entry.readsToEnd() ? IndexEntry::kReadToEnd : entry.end_offset - entry.start_offset;
    std::vector<char> buf(kReadChunk);
    uint64_t total = 0;
    bool more = true;
    while (more && remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
        file.read(buf.data(), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(file.gcount());
        if (got == 0) {
            if (total == 0) {
                throw CorruptArchiveError("Offset " + std::to_string(entry.start_offset) + " lies at or beyond the end of " +
                                          archivePath_);
            }
            break;
        }
        total += got;
        remaining -= got;
        more = decoder->decode(buf.data(), got, sink);
        if (got < want) break;
    }
    scanner.finish();

    if (!scanner.done()) {
        if (!decoder->complete()) {
            std::cerr << "Warning: span [" << entry.start_offset << ", "
                      << (entry.readsToEnd() ? std::string("EOF") : std::to_string(entry.end_offset))
                      << ") of " << archivePath_ << " ended inside a " << codecName(codec_) << " stream" << std::endl;
        }
        throw ScanNotFoundError(entry.title, entry.document_id);
    }

    ExtractedDocument doc;
    doc.document_id = entry.document_id;
    doc.raw_text = scanner.takeResult();
    recent_.put(entry.title, doc);
    return doc;
}
