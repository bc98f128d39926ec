#include "document_scanner.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {

const char kPageTag[] = "page";
const char kIdTag[] = "id";
const char kCommentOpen[] = "<!--";
const char kCdataOpen[] = "<![CDATA[";

bool isNameStart(char c) {
    return isalpha(static_cast<unsigned char>(c)) || c == '_' || c == ':';
}

bool isMarkupLead(char c) {
    return isNameStart(c) || c == '/' || c == '!' || c == '?';
}

bool isSpace(char c) {
    return isspace(static_cast<unsigned char>(c)) != 0;
}

// Attribute values keep their source escaping; only the delimiter needs care.
std::string quoteAttribute(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char c : value) {
        if (c == '"') {
            out += "&quot;";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

// Scan transitions. Every handler is a no-op once the target is found.

void handleStartTag(ScanState& s, const MarkupTag& tag) {
    if (s.status == ScanStatus::Done) return;

    if (tag.name == kPageTag) {
        s.buffer.clear();
        s.observedId.clear();
        s.hasObservedId = false;
        s.awaitingId = false;
        s.depth = 0;
    } else if (tag.name == kIdTag && s.depth == 1 && !tag.selfClosing) {
        s.awaitingId = true;
    }

    s.buffer += tag.serialize();
    if (!tag.selfClosing) s.depth++;
}

void handleText(ScanState& s, std::string_view text) {
    if (s.status == ScanStatus::Done) return;

    if (s.awaitingId && !s.hasObservedId) {
        s.observedId = Utils::trim(std::string(text));
        s.hasObservedId = true;
    }
    s.buffer.append(text.data(), text.size());
}

void handleEndTag(ScanState& s, std::string_view name) {
    if (s.status == ScanStatus::Done) return;

    s.buffer += "</";
    s.buffer.append(name.data(), name.size());
    s.buffer += '>';
    if (s.depth > 0) s.depth--;

    if (name == kIdTag) {
        s.awaitingId = false;
    } else if (name == kPageTag && s.hasObservedId && s.observedId == s.targetId) {
        s.result = std::move(s.buffer);
        s.buffer.clear();
        s.status = ScanStatus::Done;
    }
}

class ScanHandler : public MarkupHandler {
public:
    explicit ScanHandler(ScanState& state) : state_(state) {}

    void onStartTag(const MarkupTag& tag) override { handleStartTag(state_, tag); }
    void onText(std::string_view text) override { handleText(state_, text); }
    void onEndTag(std::string_view name) override { handleEndTag(state_, name); }
    bool wantsMore() const override { return state_.status != ScanStatus::Done; }

private:
    ScanState& state_;
};

} // namespace

// MarkupTag

std::string MarkupTag::serialize() const {
    std::string out;
    out += '<';
    out += name;
    for (const auto& attr : attributes) {
        out += ' ';
        out += attr.first;
        out += '=';
        out += quoteAttribute(attr.second);
    }
    out += selfClosing ? " />" : ">";
    return out;
}

// MarkupTokenizer

void MarkupTokenizer::feed(std::string_view chunk, MarkupHandler& handler) {
    pending_.append(chunk.data(), chunk.size());
    process(handler, false);
}

void MarkupTokenizer::finish(MarkupHandler& handler) {
    process(handler, true);
    pending_.clear();
    textSearchFrom_ = 0;
}

void MarkupTokenizer::process(MarkupHandler& handler, bool final) {
    size_t pos = 0;
    bool heldText = false;
    const size_t n = pending_.size();

    while (pos < n && handler.wantsMore()) {
        if (pending_[pos] == '<') {
            if (pos + 1 >= n) {
                if (!final) break;
                handler.onText(std::string_view(pending_).substr(pos));
                pos = n;
                break;
            }
            if (isMarkupLead(pending_[pos + 1])) {
                size_t used = consumeMarkup(pos, handler);
                if (used == 0) {
                    // Unterminated markup; at the end of input it is a truncated fragment
                    if (final) pos = n;
                    break;
                }
                pos += used;
                continue;
            }
        }

        // Text run up to the next real markup start
        size_t searchFrom = std::max(pos + 1, textSearchFrom_);
        size_t end = std::string::npos;
        while (true) {
            size_t lt = pending_.find('<', searchFrom);
            if (lt == std::string::npos) break;
            if (lt + 1 >= n) {
                searchFrom = lt;
                break;
            }
            if (isMarkupLead(pending_[lt + 1])) {
                end = lt;
                break;
            }
            searchFrom = lt + 1;
        }
        if (end == std::string::npos) {
            if (final) {
                handler.onText(std::string_view(pending_).substr(pos));
                pos = n;
            } else {
                textSearchFrom_ = searchFrom - pos;
                heldText = true;
            }
            break;
        }
        handler.onText(std::string_view(pending_).substr(pos, end - pos));
        pos = end;
        textSearchFrom_ = 0;
    }

    pending_.erase(0, pos);
    if (!heldText) textSearchFrom_ = 0;
}

size_t MarkupTokenizer::consumeMarkup(size_t pos, MarkupHandler& handler) {
    const size_t avail = pending_.size() - pos;
    const char lead = pending_[pos + 1];

    if (lead == '!') {
        const size_t commentLen = sizeof(kCommentOpen) - 1;
        const size_t cdataLen = sizeof(kCdataOpen) - 1;
        if (avail < commentLen) return 0;
        if (pending_.compare(pos, commentLen, kCommentOpen) == 0) {
            size_t end = pending_.find("-->", pos + commentLen);
            if (end == std::string::npos) return 0;
            return end + 3 - pos;
        }
        if (avail < cdataLen && std::strncmp(pending_.data() + pos, kCdataOpen, avail) == 0) return 0;
        if (pending_.compare(pos, cdataLen, kCdataOpen) == 0) {
            size_t end = pending_.find("]]>", pos + cdataLen);
            if (end == std::string::npos) return 0;
            handler.onText(std::string_view(pending_).substr(pos, end + 3 - pos));
            return end + 3 - pos;
        }
        size_t gt = pending_.find('>', pos);
        if (gt == std::string::npos) return 0;
        return gt + 1 - pos;
    }

    if (lead == '?') {
        size_t end = pending_.find("?>", pos + 2);
        if (end == std::string::npos) return 0;
        return end + 2 - pos;
    }

    if (lead == '/') {
        size_t gt = pending_.find('>', pos + 2);
        if (gt == std::string::npos) return 0;
        std::string name = Utils::trim(pending_.substr(pos + 2, gt - pos - 2));
        handler.onEndTag(name);
        return gt + 1 - pos;
    }

    // Start tag; '>' inside a quoted attribute value does not close it
    char quote = 0;
    size_t gt = std::string::npos;
    for (size_t i = pos + 1; i < pending_.size(); ++i) {
        char c = pending_[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            gt = i;
            break;
        }
    }
    if (gt == std::string::npos) return 0;

    MarkupTag tag;
    std::string_view body = std::string_view(pending_).substr(pos + 1, gt - pos - 1);
    if (parseStartTag(body, tag)) {
        handler.onStartTag(tag);
    } else {
        handler.onText(std::string_view(pending_).substr(pos, gt + 1 - pos));
    }
    return gt + 1 - pos;
}

bool MarkupTokenizer::parseStartTag(std::string_view body, MarkupTag& tag) {
    const size_t n = body.size();
    size_t i = 0;
    while (i < n && !isSpace(body[i]) && body[i] != '/') i++;
    if (i == 0) return false;
    tag.name.assign(body.data(), i);

    while (i < n) {
        while (i < n && isSpace(body[i])) i++;
        if (i >= n) break;

        if (body[i] == '/') {
            size_t j = i + 1;
            while (j < n && isSpace(body[j])) j++;
            if (j == n) tag.selfClosing = true;
            i++;
            continue;
        }

        size_t nameStart = i;
        while (i < n && !isSpace(body[i]) && body[i] != '=' && body[i] != '/') i++;
        std::string attrName(body.data() + nameStart, i - nameStart);

        while (i < n && isSpace(body[i])) i++;
        std::string value;
        if (i < n && body[i] == '=') {
            i++;
            while (i < n && isSpace(body[i])) i++;
            if (i < n && (body[i] == '"' || body[i] == '\'')) {
                char q = body[i++];
                size_t valueStart = i;
                while (i < n && body[i] != q) i++;
                value.assign(body.data() + valueStart, i - valueStart);
                if (i < n) i++;
            } else {
                size_t valueStart = i;
                while (i < n && !isSpace(body[i])) i++;
                value.assign(body.data() + valueStart, i - valueStart);
            }
        }
        if (!attrName.empty()) tag.attributes.emplace_back(std::move(attrName), std::move(value));
    }
    return true;
}

// DocumentScanner

DocumentScanner::DocumentScanner(std::string targetId) {
    state_.targetId = std::move(targetId);
}

bool DocumentScanner::feed(std::string_view chunk) {
    if (done()) return false;
    ScanHandler handler(state_);
    tokenizer_.feed(chunk, handler);
    return !done();
}

void DocumentScanner::finish() {
    if (done()) return;
    ScanHandler handler(state_);
    tokenizer_.finish(handler);
}

std::optional<std::string> scanDocument(std::string_view block, const std::string& targetId) {
    DocumentScanner scanner(targetId);
    scanner.feed(block);
    scanner.finish();
    if (!scanner.done()) return std::nullopt;
    return scanner.takeResult();
}
