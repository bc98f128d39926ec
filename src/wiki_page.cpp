#include "wiki_page.hpp"
#include "utils.hpp"

#include <cctype>
#include <unordered_set>

namespace {

// Namespaces whose links never point at articles
const std::unordered_set<std::string> kSkippedNamespaces = {
    "file", "image", "media", "template", "wikipedia", "wp", "help", "portal",
    "special", "talk", "user", "user talk", "draft", "module", "mediawiki",
    "wikt", "wiktionary", "wikisource", "wikiquote", "commons", "s", "q", "w",
    "book", "timedtext", "education program", "gadget", "topic",
};

const char kCategoryNamespace[] = "category";

// Text content of the first <tag ...>...</tag>. Empty when absent or self-closing.
bool findElement(const std::string& raw, const std::string& tag, std::string& out, std::string* openTag = nullptr) {
    std::string open = "<" + tag;
    size_t pos = 0;
    while (true) {
        pos = raw.find(open, pos);
        if (pos == std::string::npos) return false;
        char next = pos + open.size() < raw.size() ? raw[pos + open.size()] : '\0';
        if (next == '>' || next == ' ' || next == '/' || next == '\t' || next == '\n') break;
        pos += open.size();
    }
    size_t gt = raw.find('>', pos);
    if (gt == std::string::npos) return false;
    if (openTag) *openTag = raw.substr(pos, gt + 1 - pos);
    if (raw[gt - 1] == '/') {
        out.clear();
        return true;
    }
    std::string close = "</" + tag + ">";
    size_t end = raw.find(close, gt + 1);
    if (end == std::string::npos) return false;
    out = raw.substr(gt + 1, end - gt - 1);
    return true;
}

std::string attributeValue(const std::string& openTag, const std::string& name) {
    std::string key = name + "=";
    size_t pos = openTag.find(" " + key);
    if (pos == std::string::npos) return "";
    pos += key.size() + 1;
    if (pos >= openTag.size()) return "";
    char quote = openTag[pos];
    if (quote != '"' && quote != '\'') return "";
    size_t end = openTag.find(quote, pos + 1);
    if (end == std::string::npos) return "";
    return openTag.substr(pos + 1, end - pos - 1);
}

void appendUtf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x110000) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

void addUnique(std::vector<std::string>& list, std::unordered_set<std::string>& seen, const std::string& value) {
    if (value.empty()) return;
    if (seen.insert(value).second) list.push_back(value);
}

// Finds the next [[target]] or [[target|caption]] at or after pos and
// advances pos past it. Target and caption hold no brackets; the target
// holds no '|' and is never empty.
bool findLink(const std::string& text, size_t& pos, std::string& target) {
    static const char kTargetStops[] = "[]|";
    static const char kCaptionStops[] = "[]";

    while ((pos = text.find("[[", pos)) != std::string::npos) {
        size_t begin = pos + 2;
        size_t end = text.find_first_of(kTargetStops, begin);
        if (end == std::string::npos) return false;
        if (end > begin) {
            size_t close = end;
            if (text[end] == '|') close = text.find_first_of(kCaptionStops, end + 1);
            if (close != std::string::npos && text.compare(close, 2, "]]") == 0) {
                target = text.substr(begin, end - begin);
                pos = close + 2;
                return true;
            }
        }
        pos++;
    }
    return false;
}

// [a-z]{2,3} followed by any number of -[a-z]+ segments.
bool isLanguagePrefix(const std::string& prefix) {
    size_t i = 0;
    const size_t n = prefix.size();
    while (i < n && islower(static_cast<unsigned char>(prefix[i]))) i++;
    if (i < 2 || i > 3) return false;
    while (i < n) {
        if (prefix[i] != '-') return false;
        size_t segment = ++i;
        while (i < n && islower(static_cast<unsigned char>(prefix[i]))) i++;
        if (i == segment) return false;
    }
    return true;
}

} // namespace

std::string decodeEntities(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }
        size_t semi = text.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10) {
            out += text[i++];
            continue;
        }
        std::string name = text.substr(i + 1, semi - i - 1);
        if (name == "lt") out += '<';
        else if (name == "gt") out += '>';
        else if (name == "amp") out += '&';
        else if (name == "quot") out += '"';
        else if (name == "apos") out += '\'';
        else if (name.size() > 1 && name[0] == '#') {
            unsigned long cp = 0;
            try {
                cp = (name[1] == 'x' || name[1] == 'X') ? std::stoul(name.substr(2), nullptr, 16)
                                                        : std::stoul(name.substr(1), nullptr, 10);
            } catch (const std::exception&) {
                out += text[i++];
                continue;
            }
            appendUtf8(out, cp);
        } else {
            out += text[i++];
            continue;
        }
        i = semi + 1;
    }
    return out;
}

std::string normalizeTitle(const std::string& target) {
    std::string t = target;
    size_t hash = t.find('#');
    if (hash != std::string::npos) t.erase(hash);

    std::string out;
    out.reserve(t.size());
    bool pendingSpace = false;
    for (char c : t) {
        if (c == '_' || isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += c;
    }
    if (!out.empty()) out[0] = static_cast<char>(toupper(static_cast<unsigned char>(out[0])));
    return out;
}

void extractLinks(const std::string& wikitext, std::vector<std::string>& links,
                  std::vector<std::string>& categories) {
    std::unordered_set<std::string> seenLinks(links.begin(), links.end());
    std::unordered_set<std::string> seenCategories(categories.begin(), categories.end());

    size_t pos = 0;
    std::string rawTarget;
    while (findLink(wikitext, pos, rawTarget)) {
        std::string target = Utils::trim(rawTarget);
        bool leadingColon = !target.empty() && target[0] == ':';
        if (leadingColon) target = Utils::trim(target.substr(1));

        size_t colon = target.find(':');
        if (colon != std::string::npos) {
            std::string rawPrefix = Utils::trim(target.substr(0, colon));
            std::string prefix = Utils::toLower(rawPrefix);
            std::string rest = target.substr(colon + 1);
            if (prefix == kCategoryNamespace) {
                if (!leadingColon) addUnique(categories, seenCategories, normalizeTitle(rest));
                continue;
            }
            if (kSkippedNamespaces.count(prefix)) continue;
            // Interlanguage links: [[fr:Titre]], [[zh-yue:...]]
            if (isLanguagePrefix(rawPrefix)) continue;
        }
        addUnique(links, seenLinks, normalizeTitle(target));
    }
}

std::vector<std::string> extractInfoboxes(const std::string& wikitext) {
    static const char kInfobox[] = "nfobox";
    const size_t infoboxLen = sizeof(kInfobox) - 1;

    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    const size_t n = wikitext.size();
    size_t pos = 0;
    while ((pos = wikitext.find("{{", pos)) != std::string::npos) {
        size_t i = pos + 2;
        pos += 2;
        while (i < n && isspace(static_cast<unsigned char>(wikitext[i]))) i++;
        if (i >= n || (wikitext[i] != 'I' && wikitext[i] != 'i')) continue;
        if (wikitext.compare(i + 1, infoboxLen, kInfobox) != 0) continue;
        i += 1 + infoboxLen;

        size_t sep = i;
        while (i < n && (wikitext[i] == ' ' || wikitext[i] == '_')) i++;
        if (i == sep) continue;

        size_t nameEnd = wikitext.find_first_of("|}\n<", i);
        if (nameEnd == std::string::npos) nameEnd = n;
        std::string name = Utils::toLower(Utils::trim(wikitext.substr(i, nameEnd - i)));
        for (char& c : name) {
            if (c == '_') c = ' ';
        }
        addUnique(names, seen, name);
    }
    return names;
}

PageRecord MediaWikiPageParser::parse(const std::string& rawText) const {
    std::string page;
    if (!findElement(rawText, "page", page)) {
        throw PageParseError("Document has no <page> element");
    }

    PageRecord record;
    std::string value;
    if (!findElement(page, "title", value) || Utils::trim(value).empty()) {
        throw PageParseError("Page has no <title>");
    }
    record.title = decodeEntities(Utils::trim(value));
    if (findElement(page, "id", value)) record.id = Utils::trim(value);
    if (findElement(page, "ns", value)) record.ns = Utils::trim(value);

    std::string openTag;
    if (findElement(page, "redirect", value, &openTag)) {
        record.redirect = normalizeTitle(decodeEntities(attributeValue(openTag, "title")));
    }
    if (findElement(page, "text", value)) {
        record.text = decodeEntities(value);
    }

    extractLinks(record.text, record.links, record.categories);
    record.infoboxes = extractInfoboxes(record.text);
    return record;
}
