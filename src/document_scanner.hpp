#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct MarkupTag {
    std::string name;
    std::vector<std::pair<std::string, std::string>> attributes; // source order
    bool selfClosing = false;

    // <name a="v" ...> (or <name ... /> when self-closing)
    std::string serialize() const;
};

class MarkupHandler {
public:
    virtual ~MarkupHandler() = default;
    virtual void onStartTag(const MarkupTag& tag) = 0;
    virtual void onText(std::string_view text) = 0;
    virtual void onEndTag(std::string_view name) = 0;
    // Checked between events; false stops tokenizing.
    virtual bool wantsMore() const { return true; }
};

// Incremental tag/text tokenizer. Input may be split anywhere; markup and
// text runs cut by a chunk boundary are held back until complete. Text is
// passed through untouched (entities are not decoded). Comments, doctype
// and processing instructions are dropped.
class MarkupTokenizer {
public:
    void feed(std::string_view chunk, MarkupHandler& handler);
    // Flushes trailing text. An unterminated tag at the end is discarded.
    void finish(MarkupHandler& handler);

private:
    std::string pending_;
    size_t textSearchFrom_ = 0;

    void process(MarkupHandler& handler, bool final);
    // Returns bytes consumed, 0 when more input is needed.
    size_t consumeMarkup(size_t pos, MarkupHandler& handler);
    static bool parseStartTag(std::string_view body, MarkupTag& tag);
};

enum class ScanStatus {
    Searching,
    Done
};

// Per-scan context; one instance per extraction call.
struct ScanState {
    std::string targetId;
    ScanStatus status = ScanStatus::Searching;

    std::string buffer;            // reconstructed text of the current candidate
    std::string observedId;
    bool hasObservedId = false;
    bool awaitingId = false;
    int depth = 0;                 // element depth, 1 == directly inside <page>

    std::string result;
};

// Streaming state machine that reconstructs the one <page> whose own <id>
// equals the target. Everything after a match is ignored, so a truncated
// trailing fragment cannot disturb a document matched earlier in the block.
class DocumentScanner {
public:
    explicit DocumentScanner(std::string targetId);

    // Returns false once the target has been found.
    bool feed(std::string_view chunk);
    void finish();

    bool done() const { return state_.status == ScanStatus::Done; }
    const std::string& result() const { return state_.result; }
    std::string takeResult() { return std::move(state_.result); }

private:
    ScanState state_;
    MarkupTokenizer tokenizer_;
};

// Scans a complete decoded block; nullopt when no document matched.
std::optional<std::string> scanDocument(std::string_view block, const std::string& targetId);
