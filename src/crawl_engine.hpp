#pragma once

#include "archive_extractor.hpp"
#include "classification_cache.hpp"
#include "classifiers.hpp"
#include "graph_store.hpp"
#include "wiki_page.hpp"

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

enum class LinkFailure {
    None,
    NotFound,
    CorruptArchive,
    ScanNotFound,
    ParseError,
    Other
};

const char* linkFailureName(LinkFailure failure);

// What happened to one outgoing link.
struct LinkOutcome {
    std::string source;      // title of the page holding the link
    std::string title;       // link target as emitted by the parser
    std::string identity;    // resolved document id, empty if unresolved
    bool accepted = false;
    bool fromCache = false;
    LinkFailure failure = LinkFailure::None;
    std::string reason;      // classifier reason or error message
};

struct CrawlNode {
    PageRecord page;
    GraphStore::Handle handle = 0;
    // Absent for nodes registered from a cached verdict without extraction.
    std::optional<std::vector<std::string>> links;
};

struct CrawlConfig {
    size_t bound = 150;
    bool followRedirects = true;
    bool verbose = true;
};

struct CrawlStats {
    size_t seedsRegistered = 0;
    size_t seedFailures = 0;
    size_t nodesVisited = 0;
    size_t nodesSkipped = 0;
    size_t linksSeen = 0;
    size_t cacheHits = 0;
    size_t accepted = 0;
    size_t rejected = 0;
    size_t failures = 0;
    bool boundReached = false;
    std::map<std::string, size_t> rejectReasons;
    std::map<std::string, size_t> failureKinds;
};

// Bounded breadth-first crawl over the link graph of the archive.
//
// Seeds are registered without classification. Every other page is
// classified at most once per identity (document id); the verdict goes into
// the classification cache and only fresh positive verdicts count toward
// the bound. The bound is checked before each node is expanded.
class CrawlEngine {
public:
    using OutcomeSink = std::function<void(const LinkOutcome&)>;

    CrawlEngine(DocumentSource& source, const DocumentParser& parser, const PageClassifier& classifier,
                ClassificationCache& cache, GraphStore& graph, CrawlConfig config = CrawlConfig());

    void setOutcomeSink(OutcomeSink sink) { sink_ = std::move(sink); }

    CrawlStats run(const std::vector<std::string>& seeds);

    size_t acceptedCount() const { return acceptedCount_; }
    size_t queued() const { return queue_.size(); }

private:
    struct Evaluation {
        bool positive = false;
        bool fromCache = false;           // redirect target already had a verdict
        IndexEntry entry;                 // final entry after a followed redirect
        std::optional<PageRecord> page;
        LinkFailure failure = LinkFailure::None;
        std::string reason;
    };

    DocumentSource& source_;
    const DocumentParser& parser_;
    const PageClassifier& classifier_;
    ClassificationCache& cache_;
    GraphStore& graph_;
    CrawlConfig config_;
    OutcomeSink sink_;

    std::deque<CrawlNode> queue_;
    std::unordered_set<std::string> enqueued_;
    std::unordered_map<std::string, std::string> nodeTitles_; // identity -> first title seen
    std::unordered_map<std::string, IndexEntry> redirects_; // redirect id -> target entry
    size_t acceptedCount_ = 0;

    bool registerSeed(const std::string& title);
    void processLink(const CrawlNode& node, const std::string& link, CrawlStats& stats);
    Evaluation evaluate(const IndexEntry& entry);
    PageRecord load(const IndexEntry& entry);
    GraphStore::Handle registerNode(const std::string& identity, const std::string& title);
    void enqueue(const std::string& identity, CrawlNode node);
    void report(const LinkOutcome& outcome, CrawlStats& stats);
};
