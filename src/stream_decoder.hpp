#pragma once

#include <bzlib.h>
#include <zlib.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

enum class ArchiveCodec {
    Bzip2,
    Gzip
};

// .gz selects gzip, everything else is treated as a bzip2 multistream dump.
ArchiveCodec codecForPath(const std::string& path);
const char* codecName(ArchiveCodec codec);

// Receives decoded bytes; returning false stops decoding.
using DecodeSink = std::function<bool(const char* data, size_t size)>;

// Incremental decoder for one compressed span. A span may hold several
// concatenated streams; each is decoded in turn. Input that ends before a
// stream's end marker is not an error, the caller just gets less output.
class BlockDecoder {
public:
    virtual ~BlockDecoder() = default;

    // Returns false if the sink asked to stop. Throws CorruptArchiveError.
    virtual bool decode(const char* data, size_t size, const DecodeSink& sink) = 0;

    // True when the last stream seen was closed by its end marker.
    virtual bool complete() const = 0;

    size_t streamsDecoded() const { return streamsDecoded_; }

    static std::unique_ptr<BlockDecoder> create(ArchiveCodec codec);

protected:
    size_t streamsDecoded_ = 0;
};

class Bzip2BlockDecoder : public BlockDecoder {
public:
    Bzip2BlockDecoder();
    ~Bzip2BlockDecoder() override;

    Bzip2BlockDecoder(const Bzip2BlockDecoder&) = delete;
    Bzip2BlockDecoder& operator=(const Bzip2BlockDecoder&) = delete;

    bool decode(const char* data, size_t size, const DecodeSink& sink) override;
    bool complete() const override { return !active_ && streamsDecoded_ > 0; }

private:
    bz_stream strm_;
    bool active_ = false;
    bool trailing_ = false;
    char out_[64 * 1024];

    void begin();
    void end();
};

class GzipBlockDecoder : public BlockDecoder {
public:
    GzipBlockDecoder();
    ~GzipBlockDecoder() override;

    GzipBlockDecoder(const GzipBlockDecoder&) = delete;
    GzipBlockDecoder& operator=(const GzipBlockDecoder&) = delete;

    bool decode(const char* data, size_t size, const DecodeSink& sink) override;
    bool complete() const override { return atMemberStart_ && streamsDecoded_ > 0; }

private:
    z_stream strm_;
    bool atMemberStart_ = true;
    bool trailing_ = false;
    char out_[64 * 1024];
};
