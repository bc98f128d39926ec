#include "stream_decoder.hpp"
#include "archive_errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <climits>
#include <cstring>

ArchiveCodec codecForPath(const std::string& path) {
    std::string lower = Utils::toLower(path);
    if (Utils::endsWith(lower, ".gz")) return ArchiveCodec::Gzip;
    return ArchiveCodec::Bzip2;
}

const char* codecName(ArchiveCodec codec) {
    switch (codec) {
        case ArchiveCodec::Bzip2: return "bzip2";
        case ArchiveCodec::Gzip: return "gzip";
    }
    return "unknown";
}

std::unique_ptr<BlockDecoder> BlockDecoder::create(ArchiveCodec codec) {
    if (codec == ArchiveCodec::Gzip) {
        return std::unique_ptr<BlockDecoder>(new GzipBlockDecoder());
    }
    return std::unique_ptr<BlockDecoder>(new Bzip2BlockDecoder());
}

// Bzip2BlockDecoder

Bzip2BlockDecoder::Bzip2BlockDecoder() {
    std::memset(&strm_, 0, sizeof(strm_));
}

Bzip2BlockDecoder::~Bzip2BlockDecoder() {
    if (active_) end();
}

void Bzip2BlockDecoder::begin() {
    std::memset(&strm_, 0, sizeof(strm_));
    int rc = BZ2_bzDecompressInit(&strm_, 0, 0);
    if (rc != BZ_OK) {
        throw CorruptArchiveError("bzip2: decompressor init failed (code " + std::to_string(rc) + ")");
    }
    active_ = true;
}

void Bzip2BlockDecoder::end() {
    BZ2_bzDecompressEnd(&strm_);
    active_ = false;
}

bool Bzip2BlockDecoder::decode(const char* data, size_t size, const DecodeSink& sink) {
    if (trailing_) return true;

    const char* in = data;
    size_t remaining = size;
    while (true) {
        if (!active_) {
            if (remaining == 0) return true;
            begin();
        }
        unsigned int feed = static_cast<unsigned int>(std::min<size_t>(remaining, UINT_MAX));
        strm_.next_in = const_cast<char*>(in);
        strm_.avail_in = feed;
        strm_.next_out = out_;
        strm_.avail_out = sizeof(out_);

        int rc = BZ2_bzDecompress(&strm_);
        size_t consumed = feed - strm_.avail_in;
        in += consumed;
        remaining -= consumed;
        size_t produced = sizeof(out_) - strm_.avail_out;

        // Bytes after a finished stream that are not another stream header
        if (rc == BZ_DATA_ERROR_MAGIC && streamsDecoded_ > 0) {
            end();
            trailing_ = true;
            return true;
        }
        if (rc != BZ_OK && rc != BZ_STREAM_END) {
            end();
            throw CorruptArchiveError("bzip2: decode failed (code " + std::to_string(rc) + ")");
        }

        if (produced > 0 && !sink(out_, produced)) return false;

        if (rc == BZ_STREAM_END) {
            end();
            streamsDecoded_++;
            continue;
        }
        if (remaining == 0 && strm_.avail_out != 0) return true;
    }
}

// GzipBlockDecoder

GzipBlockDecoder::GzipBlockDecoder() {
    std::memset(&strm_, 0, sizeof(strm_));
    // 16 + MAX_WBITS: expect gzip member headers
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw CorruptArchiveError("gzip: inflater init failed");
    }
}

GzipBlockDecoder::~GzipBlockDecoder() {
    inflateEnd(&strm_);
}

bool GzipBlockDecoder::decode(const char* data, size_t size, const DecodeSink& sink) {
    if (trailing_) return true;

    const char* in = data;
    size_t remaining = size;
    while (true) {
        uInt feed = static_cast<uInt>(std::min<size_t>(remaining, UINT_MAX));
        strm_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in));
        strm_.avail_in = feed;
        strm_.next_out = reinterpret_cast<Bytef*>(out_);
        strm_.avail_out = sizeof(out_);

        bool wasAtStart = atMemberStart_;
        int rc = inflate(&strm_, Z_NO_FLUSH);
        size_t consumed = feed - strm_.avail_in;
        in += consumed;
        remaining -= consumed;
        size_t produced = sizeof(out_) - strm_.avail_out;

        if (rc == Z_DATA_ERROR && wasAtStart && streamsDecoded_ > 0) {
            trailing_ = true;
            return true;
        }
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
            throw CorruptArchiveError(std::string("gzip: decode failed: ") + (strm_.msg ? strm_.msg : "unknown error"));
        }
        if (consumed > 0) atMemberStart_ = false;

        if (produced > 0 && !sink(out_, produced)) return false;

        if (rc == Z_STREAM_END) {
            streamsDecoded_++;
            inflateReset(&strm_);
            atMemberStart_ = true;
            if (remaining == 0) return true;
            continue;
        }
        if (rc == Z_BUF_ERROR) return true;
        if (remaining == 0 && strm_.avail_out != 0) return true;
    }
}
