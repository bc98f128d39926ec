// =============================================================================
// Crawl engine tests
// =============================================================================

#include <gtest/gtest.h>
#include "archive_fixture.hpp"
#include "archive_errors.hpp"
#include "archive_extractor.hpp"
#include "classification_cache.hpp"
#include "classifiers.hpp"
#include "crawl_engine.hpp"
#include "graph_store.hpp"
#include "wiki_page.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace {

// In-memory document source over hand-written pages.
class FakeSource : public DocumentSource {
public:
    void add(const std::string& id, const std::string& title, const std::string& text,
             const std::string& extra = "") {
        fixture::Page p;
        p.id = id;
        p.title = title;
        p.text = text;
        p.extra = extra;
        IndexEntry e;
        e.document_id = id;
        e.title = title;
        byTitle_[title] = e;
        docs_[id] = fixture::pageElement(p);
    }

    void breakDocument(const std::string& id) { broken_.insert(id); }

    int retrievals(const std::string& id) const {
        auto it = retrievals_.find(id);
        return it == retrievals_.end() ? 0 : it->second;
    }

    IndexEntry resolve(const std::string& title) const override {
        auto it = byTitle_.find(title);
        if (it == byTitle_.end()) throw ArticleNotFoundError(title);
        return it->second;
    }

    ExtractedDocument retrieve(const IndexEntry& entry) override {
        retrievals_[entry.document_id]++;
        if (broken_.count(entry.document_id)) {
            throw CorruptArchiveError("bzip2: decode failed (code -4)");
        }
        ExtractedDocument doc;
        doc.document_id = entry.document_id;
        doc.raw_text = docs_.at(entry.document_id);
        return doc;
    }

private:
    std::map<std::string, IndexEntry> byTitle_;
    std::map<std::string, std::string> docs_;
    std::set<std::string> broken_;
    std::map<std::string, int> retrievals_;
};

// Positive for a fixed set of titles.
class TitleClassifier : public PageClassifier {
public:
    explicit TitleClassifier(std::set<std::string> positive) : positive_(std::move(positive)) {}

    FilterResult classify(const PageRecord& page) const override {
        if (positive_.count(page.title)) return {true, "listed"};
        return {false, "unlisted"};
    }

private:
    std::set<std::string> positive_;
};

} // namespace

class CrawlEngineTest : public ::testing::Test {
protected:
    CrawlStats crawl(const std::vector<std::string>& seeds, const std::set<std::string>& positive, size_t bound) {
        classifier_ = std::make_unique<TitleClassifier>(positive);
        CrawlConfig config;
        config.bound = bound;
        config.verbose = false;
        CrawlEngine engine(source_, parser_, *classifier_, cache_, graph_, config);
        engine.setOutcomeSink([this](const LinkOutcome& o) { outcomes_.push_back(o); });
        return engine.run(seeds);
    }

    bool linked(const std::string& fromId, const std::string& toId) const {
        GraphStore::Handle from = 0;
        GraphStore::Handle to = 0;
        return graph_.findById(fromId, from) && graph_.findById(toId, to) && graph_.hasEdge(from, to);
    }

    bool registered(const std::string& id) const {
        GraphStore::Handle h = 0;
        return graph_.findById(id, h);
    }

    FakeSource source_;
    MediaWikiPageParser parser_;
    std::unique_ptr<TitleClassifier> classifier_;
    MemoryClassificationCache cache_;
    MemoryGraphStore graph_;
    std::vector<LinkOutcome> outcomes_;
};

TEST_F(CrawlEngineTest, StopsOnceBoundIsReached) {
    source_.add("1", "A", "Links to [[B]].");
    source_.add("2", "B", "Links to [[C]].");
    source_.add("3", "C", "Leaf.");

    CrawlStats stats = crawl({"A"}, {"B"}, 1);

    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_TRUE(stats.boundReached);
    EXPECT_EQ(stats.nodesVisited, 1u);
    EXPECT_TRUE(linked("1", "2"));
    EXPECT_FALSE(registered("3"));
    EXPECT_EQ(source_.retrievals("3"), 0);
    EXPECT_EQ(graph_.edgeCount(), 1u);
}

TEST_F(CrawlEngineTest, DrainingTheQueueIsANormalEnd) {
    source_.add("1", "A", "Links to [[B]].");
    source_.add("2", "B", "Links to [[C]].");
    source_.add("3", "C", "Leaf.");

    CrawlStats stats = crawl({"A"}, {"B"}, 10);

    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_FALSE(stats.boundReached);
    EXPECT_EQ(stats.nodesVisited, 2u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(stats.rejectReasons["unlisted"], 1u);
    EXPECT_FALSE(linked("2", "3"));
    EXPECT_EQ(cache_.get("3"), std::optional<bool>(false));
}

TEST_F(CrawlEngineTest, SeedsAreNotClassifiedOrCounted) {
    source_.add("1", "A", "Links to [[B]].");
    source_.add("2", "B", "Leaf.");

    CrawlStats stats = crawl({"A"}, {}, 5);

    EXPECT_EQ(stats.seedsRegistered, 1u);
    EXPECT_EQ(stats.accepted, 0u);
    EXPECT_TRUE(registered("1"));
    EXPECT_EQ(cache_.get("1"), std::optional<bool>(true));
}

TEST_F(CrawlEngineTest, CachedPositiveAddsEdgeWithoutCountingAgain) {
    source_.add("1", "A", "[[B]] and [[C]]");
    source_.add("2", "B", "Leaf.");
    source_.add("3", "C", "Back to [[B]].");

    CrawlStats stats = crawl({"A"}, {"B", "C"}, 10);

    EXPECT_EQ(stats.accepted, 2u);
    EXPECT_EQ(stats.cacheHits, 1u);
    EXPECT_EQ(source_.retrievals("2"), 1);
    EXPECT_TRUE(linked("1", "2"));
    EXPECT_TRUE(linked("1", "3"));
    EXPECT_TRUE(linked("3", "2"));
    EXPECT_EQ(graph_.nodeCount(), 3u);
}

TEST_F(CrawlEngineTest, RegisteredNodesMatchTheStoreProperties) {
    source_.add("1", "A", "[[B]] and [[C]]");
    source_.add("2", "B", "Leaf.");
    source_.add("3", "C", "Back to [[B]] and [[A]].");

    crawl({"A"}, {"A", "B", "C"}, 10);
    ASSERT_EQ(graph_.nodeCount(), 3u);

    GraphStore::Handle b = 0;
    ASSERT_TRUE(graph_.findById("2", b));
    EXPECT_EQ(graph_.addNode({{"id", "2"}, {"title", "B"}}), b);
    GraphStore::Handle a = 0;
    ASSERT_TRUE(graph_.findById("1", a));
    EXPECT_EQ(graph_.addNode({{"id", "1"}, {"title", "A"}}), a);
    EXPECT_EQ(graph_.nodeCount(), 3u);
    EXPECT_TRUE(linked("3", "1"));
}

TEST_F(CrawlEngineTest, PrecachedVerdictRegistersWithoutExpanding) {
    source_.add("1", "A", "[[B]]");
    source_.add("2", "B", "[[C]]");
    source_.add("3", "C", "Leaf.");
    cache_.set("2", true);

    CrawlStats stats = crawl({"A"}, {"B", "C"}, 10);

    EXPECT_EQ(stats.accepted, 0u);
    EXPECT_EQ(stats.nodesSkipped, 1u);
    EXPECT_TRUE(linked("1", "2"));
    EXPECT_EQ(source_.retrievals("2"), 0);
    EXPECT_EQ(source_.retrievals("3"), 0);
}

TEST_F(CrawlEngineTest, FailedLinksAreNegativeAndCrawlContinues) {
    source_.add("1", "A", "[[Missing]] [[Broken]] [[B]]");
    source_.add("2", "B", "[[Broken]]");
    source_.add("9", "Broken", "Unreachable.");
    source_.breakDocument("9");

    CrawlStats stats = crawl({"A"}, {"B", "Broken"}, 10);

    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_EQ(stats.failures, 2u);
    EXPECT_EQ(stats.failureKinds["not_found"], 1u);
    EXPECT_EQ(stats.failureKinds["corrupt_archive"], 1u);
    EXPECT_EQ(source_.retrievals("9"), 1);
    EXPECT_EQ(cache_.get("9"), std::optional<bool>(false));
    EXPECT_TRUE(linked("1", "2"));
    EXPECT_FALSE(registered("9"));

    ASSERT_EQ(outcomes_.size(), 4u);
    EXPECT_EQ(outcomes_[0].failure, LinkFailure::NotFound);
    EXPECT_TRUE(outcomes_[0].identity.empty());
    EXPECT_EQ(outcomes_[1].failure, LinkFailure::CorruptArchive);
    EXPECT_EQ(outcomes_[1].identity, "9");
    EXPECT_TRUE(outcomes_[2].accepted);
    EXPECT_TRUE(outcomes_[3].fromCache);
    EXPECT_FALSE(outcomes_[3].accepted);
}

TEST_F(CrawlEngineTest, CyclesAreNotExpandedTwice) {
    source_.add("1", "A", "[[B]]");
    source_.add("2", "B", "[[A]]");

    CrawlStats stats = crawl({"A"}, {"A", "B"}, 10);

    EXPECT_EQ(stats.nodesVisited, 2u);
    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_TRUE(linked("1", "2"));
    EXPECT_TRUE(linked("2", "1"));
    EXPECT_EQ(source_.retrievals("1"), 1);
    EXPECT_EQ(source_.retrievals("2"), 1);
}

TEST_F(CrawlEngineTest, FollowsRedirectsToTheirTarget) {
    source_.add("1", "A", "[[Beatles]] then [[The Beatles]] then [[B]]");
    source_.add("2", "B", "Back to [[Beatles]].");
    source_.add("5", "Beatles", "#REDIRECT [[The Beatles]]", "    <redirect title=\"The Beatles\" />\n");
    source_.add("6", "The Beatles", "Band.");

    CrawlStats stats = crawl({"A"}, {"The Beatles", "B"}, 10);

    EXPECT_EQ(stats.accepted, 2u);
    EXPECT_TRUE(linked("1", "6"));
    EXPECT_TRUE(linked("2", "6"));
    EXPECT_FALSE(registered("5"));
    EXPECT_EQ(graph_.edgeCount(), 3u);
    EXPECT_EQ(source_.retrievals("5"), 1);
    EXPECT_EQ(source_.retrievals("6"), 1);

    ASSERT_EQ(outcomes_.size(), 4u);
    EXPECT_EQ(outcomes_[0].identity, "6");
    EXPECT_FALSE(outcomes_[0].fromCache);
    EXPECT_TRUE(outcomes_[1].fromCache);
    EXPECT_EQ(outcomes_[3].identity, "6");
    EXPECT_TRUE(outcomes_[3].fromCache);
}

TEST_F(CrawlEngineTest, RedirectSeedStartsAtTarget) {
    source_.add("5", "Beatles", "#REDIRECT [[The Beatles]]", "    <redirect title=\"The Beatles\" />\n");
    source_.add("6", "The Beatles", "Band.");

    CrawlStats stats = crawl({"Beatles"}, {}, 10);

    EXPECT_EQ(stats.seedsRegistered, 1u);
    EXPECT_TRUE(registered("6"));
    EXPECT_FALSE(registered("5"));
}

TEST_F(CrawlEngineTest, UnloadableSeedIsCounted) {
    source_.add("1", "A", "Leaf.");

    CrawlStats stats = crawl({"A", "Nope", "A"}, {}, 10);

    EXPECT_EQ(stats.seedsRegistered, 2u);
    EXPECT_EQ(stats.seedFailures, 1u);
    EXPECT_EQ(stats.nodesVisited, 1u);
    EXPECT_EQ(graph_.nodeCount(), 1u);
}

TEST_F(CrawlEngineTest, ExpandsInFifoOrder) {
    source_.add("1", "A", "[[B]] [[C]]");
    source_.add("2", "B", "[[D]]");
    source_.add("3", "C", "[[E]]");
    source_.add("4", "D", "Leaf.");
    source_.add("5", "E", "Leaf.");

    crawl({"A"}, {"B", "C", "D", "E"}, 10);

    std::vector<std::string> order;
    for (const auto& o : outcomes_) order.push_back(o.source + "->" + o.title);
    std::vector<std::string> expected = {"A->B", "A->C", "B->D", "C->E"};
    EXPECT_EQ(order, expected);
}

// End to end over a real compressed archive.
TEST(CrawlEngineArchiveTest, CrawlsMusicianArticles) {
    auto artist = [](const std::string& links) {
        return "{{Infobox musical artist\n| genre = rock\n}}\n" + links;
    };
    auto page = [](const std::string& id, const std::string& title, const std::string& text) {
        fixture::Page p;
        p.id = id;
        p.title = title;
        p.text = text;
        return p;
    };

    fixture::ArchiveBuilder builder(ArchiveCodec::Bzip2);
    builder.addBlock({page("100", "Rock music", "Played by [[John Lennon]], in [[Liverpool]] and by [[Ringo Starr]]."),
                      page("101", "John Lennon", artist("Friend of [[Ringo Starr]]."))});
    builder.addBlock({page("200", "Liverpool", "{{Infobox settlement\n}}\nCity."),
                      page("201", "Ringo Starr", artist("Drummer."))});

    fixture::TempDir dir;
    std::string path = dir.file("dump.xml.bz2");
    auto index = std::make_shared<MemoryOffsetIndex>(builder.write(path));
    ArchiveExtractor extractor(path, index);

    MediaWikiPageParser parser;
    InfoboxClassifier classifier;
    MemoryClassificationCache cache;
    MemoryGraphStore graph;
    CrawlConfig config;
    config.verbose = false;

    CrawlEngine engine(extractor, parser, classifier, cache, graph, config);
    CrawlStats stats = engine.run({"Rock music"});

    EXPECT_EQ(stats.accepted, 2u);
    EXPECT_EQ(stats.failures, 0u);
    EXPECT_EQ(stats.rejectReasons["infobox_mismatch"], 1u);
    EXPECT_EQ(graph.nodeCount(), 3u);
    EXPECT_EQ(graph.edgeCount(), 3u);

    GraphStore::Handle rock = 0;
    GraphStore::Handle lennon = 0;
    GraphStore::Handle ringo = 0;
    ASSERT_TRUE(graph.findById("100", rock));
    ASSERT_TRUE(graph.findById("101", lennon));
    ASSERT_TRUE(graph.findById("201", ringo));
    EXPECT_TRUE(graph.hasEdge(rock, lennon));
    EXPECT_TRUE(graph.hasEdge(rock, ringo));
    EXPECT_TRUE(graph.hasEdge(lennon, ringo));
    EXPECT_EQ(graph.node(ringo).at("title"), "Ringo Starr");
}
