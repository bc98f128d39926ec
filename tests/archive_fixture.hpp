#pragma once

// Helpers that write small multistream dumps for the tests.

#include "offset_index.hpp"
#include "stream_decoder.hpp"

#include <bzlib.h>
#include <zlib.h>

#include <atomic>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace fixture {

struct Page {
    std::string id;
    std::string title;
    std::string text;          // wikitext, escaped on output
    std::string extra;         // raw markup placed after <id>, e.g. a <redirect/>
    std::string revisionId = "900";
};

inline std::string escapeText(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

// The <page> element exactly as the scanner reconstructs it.
inline std::string pageElement(const Page& p) {
    std::string text = escapeText(p.text);
    return "<page>\n"
           "    <title>" + escapeText(p.title) + "</title>\n"
           "    <ns>0</ns>\n"
           "    <id>" + p.id + "</id>\n" +
           p.extra +
           "    <revision>\n"
           "      <id>" + p.revisionId + "</id>\n"
           "      <contributor>\n"
           "        <username>Editor</username>\n"
           "        <id>42</id>\n"
           "      </contributor>\n"
           "      <minor />\n"
           "      <text bytes=\"" + std::to_string(text.size()) + "\" xml:space=\"preserve\">" + text + "</text>\n"
           "    </revision>\n"
           "  </page>";
}

inline std::string block(const std::vector<Page>& pages) {
    std::string out;
    for (const auto& p : pages) {
        out += "  " + pageElement(p) + "\n";
    }
    return out;
}

inline std::string compressBzip2(const std::string& data) {
    unsigned int destLen = static_cast<unsigned int>(data.size() + data.size() / 100 + 600);
    std::string out(destLen, '\0');
    int rc = BZ2_bzBuffToBuffCompress(&out[0], &destLen, const_cast<char*>(data.data()),
                                      static_cast<unsigned int>(data.size()), 9, 0, 30);
    if (rc != BZ_OK) throw std::runtime_error("bzip2 compression failed");
    out.resize(destLen);
    return out;
}

inline std::string compressGzip(const std::string& data) {
    z_stream s;
    std::memset(&s, 0, sizeof(s));
    if (deflateInit2(&s, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("gzip init failed");
    }
    std::string out(deflateBound(&s, static_cast<uLong>(data.size())) + 32, '\0');
    s.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    s.avail_in = static_cast<uInt>(data.size());
    s.next_out = reinterpret_cast<Bytef*>(&out[0]);
    s.avail_out = static_cast<uInt>(out.size());
    int rc = deflate(&s, Z_FINISH);
    size_t produced = out.size() - s.avail_out;
    deflateEnd(&s);
    if (rc != Z_STREAM_END) throw std::runtime_error("gzip compression failed");
    out.resize(produced);
    return out;
}

inline std::string compress(ArchiveCodec codec, const std::string& data) {
    return codec == ArchiveCodec::Gzip ? compressGzip(data) : compressBzip2(data);
}

// Removes its directory on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("wikicrawl_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

// Lays out a dump the way the real ones are: a siteinfo stream, one stream
// per block of pages, a closing stream. Offsets are recorded per page.
class ArchiveBuilder {
public:
    explicit ArchiveBuilder(ArchiveCodec codec) : codec_(codec) {
        data_ += compress(codec_,
                          "<mediawiki xmlns=\"http://www.mediawiki.org/xml/export-0.10/\" xml:lang=\"en\">\n"
                          "  <siteinfo>\n    <sitename>Wikipedia</sitename>\n  </siteinfo>\n");
    }

    // Returns the start offset of the block.
    uint64_t addBlock(const std::vector<Page>& pages) {
        uint64_t start = data_.size();
        data_ += compress(codec_, block(pages));
        for (const auto& p : pages) {
            IndexEntry e;
            e.start_offset = start;
            e.document_id = p.id;
            e.title = p.title;
            entries_.push_back(e);
        }
        return start;
    }

    // Writes the archive and returns the finished index entries.
    std::vector<IndexEntry> write(const std::string& path) {
        std::string out = data_ + compress(codec_, "</mediawiki>\n");
        std::ofstream f(path, std::ios::binary);
        f.write(out.data(), static_cast<std::streamsize>(out.size()));
        if (!f) throw std::runtime_error("could not write " + path);
        std::vector<IndexEntry> entries = entries_;
        assignEndOffsets(entries);
        return entries;
    }

    const std::string& bytes() const { return data_; }

private:
    ArchiveCodec codec_;
    std::string data_;
    std::vector<IndexEntry> entries_;
};

} // namespace fixture
