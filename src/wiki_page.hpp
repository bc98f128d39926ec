#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Structured view of one <page> document.
struct PageRecord {
    std::string title;
    std::string id;
    std::string ns;
    std::string redirect;                 // target title for redirect pages
    std::string text;                     // wikitext with XML entities decoded
    std::vector<std::string> links;       // article links, first-occurrence order
    std::vector<std::string> categories;
    std::vector<std::string> infoboxes;   // lower-case infobox names

    bool isRedirect() const { return !redirect.empty(); }
};

class PageParseError : public std::runtime_error {
public:
    explicit PageParseError(const std::string& what) : std::runtime_error(what) {}
};

class DocumentParser {
public:
    virtual ~DocumentParser() = default;
    // Throws PageParseError.
    virtual PageRecord parse(const std::string& rawText) const = 0;
};

class MediaWikiPageParser : public DocumentParser {
public:
    PageRecord parse(const std::string& rawText) const override;
};

// &lt; &gt; &amp; &quot; &apos; and numeric references.
std::string decodeEntities(const std::string& text);

// Canonical form of a link target: no fragment, underscores as spaces,
// collapsed whitespace, first letter upper case. Empty if nothing is left.
std::string normalizeTitle(const std::string& target);

// Splits wikitext links into article links and categories. Links into other
// namespaces and interlanguage links are dropped.
void extractLinks(const std::string& wikitext, std::vector<std::string>& links,
                  std::vector<std::string>& categories);

std::vector<std::string> extractInfoboxes(const std::string& wikitext);
