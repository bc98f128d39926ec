#include "crawl_engine.hpp"
#include "archive_errors.hpp"
#include "utils.hpp"

#include <iostream>

const char* linkFailureName(LinkFailure failure) {
    switch (failure) {
        case LinkFailure::None: return "none";
        case LinkFailure::NotFound: return "not_found";
        case LinkFailure::CorruptArchive: return "corrupt_archive";
        case LinkFailure::ScanNotFound: return "scan_not_found";
        case LinkFailure::ParseError: return "parse_error";
        case LinkFailure::Other: return "other";
    }
    return "other";
}

CrawlEngine::CrawlEngine(DocumentSource& source, const DocumentParser& parser, const PageClassifier& classifier,
                         ClassificationCache& cache, GraphStore& graph, CrawlConfig config)
    : source_(source),
      parser_(parser),
      classifier_(classifier),
      cache_(cache),
      graph_(graph),
      config_(config) {}

CrawlStats CrawlEngine::run(const std::vector<std::string>& seeds) {
    CrawlStats stats;

    for (const auto& seed : seeds) {
        if (registerSeed(seed)) {
            stats.seedsRegistered++;
        } else {
            stats.seedFailures++;
        }
    }

    while (!queue_.empty() && acceptedCount_ < config_.bound) {
        CrawlNode node = std::move(queue_.front());
        queue_.pop_front();

        // Registered from a cached verdict, never extracted: nothing to expand
        if (!node.links) {
            stats.nodesSkipped++;
            continue;
        }

        stats.nodesVisited++;
        if (config_.verbose) {
            std::cout << "Expanding \"" << node.page.title << "\" (" << node.links->size() << " links, "
                      << acceptedCount_ << "/" << config_.bound << " accepted)" << std::endl;
        }
        for (const auto& link : *node.links) {
            processLink(node, link, stats);
        }
    }

    stats.accepted = acceptedCount_;
    stats.boundReached = acceptedCount_ >= config_.bound;
    return stats;
}

bool CrawlEngine::registerSeed(const std::string& title) {
    IndexEntry entry;
    PageRecord page;
    try {
        entry = source_.resolve(title);
        page = load(entry);
        if (config_.followRedirects && page.isRedirect()) {
            entry = source_.resolve(page.redirect);
            page = load(entry);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: could not load seed \"" << title << "\": " << e.what() << std::endl;
        return false;
    }

    cache_.set(entry.document_id, true);
    if (enqueued_.count(entry.document_id)) return true;

    CrawlNode node;
    node.handle = registerNode(entry.document_id, page.title);
    node.links = page.links;
    node.page = std::move(page);
    enqueue(entry.document_id, std::move(node));
    return true;
}

void CrawlEngine::processLink(const CrawlNode& node, const std::string& link, CrawlStats& stats) {
    LinkOutcome outcome;
    outcome.source = node.page.title;
    outcome.title = link;
    stats.linksSeen++;

    IndexEntry entry;
    try {
        entry = source_.resolve(link);
    } catch (const ArticleNotFoundError& e) {
        outcome.failure = LinkFailure::NotFound;
        outcome.reason = e.what();
        report(outcome, stats);
        return;
    } catch (const std::exception& e) {
        outcome.failure = LinkFailure::Other;
        outcome.reason = e.what();
        report(outcome, stats);
        return;
    }

    auto alias = redirects_.find(entry.document_id);
    if (alias != redirects_.end()) entry = alias->second;
    outcome.identity = entry.document_id;

    std::optional<PageRecord> page;
    std::optional<bool> cached = cache_.get(entry.document_id);
    if (cached) {
        outcome.accepted = *cached;
        outcome.fromCache = true;
    } else {
        Evaluation ev = evaluate(entry);
        entry = ev.entry;
        outcome.identity = entry.document_id;
        outcome.failure = ev.failure;
        outcome.reason = ev.reason;
        outcome.accepted = ev.positive;
        if (ev.fromCache) {
            outcome.fromCache = true;
        } else {
            cache_.set(entry.document_id, ev.positive);
            if (ev.positive) acceptedCount_++;
            page = std::move(ev.page);
        }
    }

    if (outcome.accepted) {
        const std::string& identity = entry.document_id;
        GraphStore::Handle child = registerNode(identity, page ? page->title : entry.title);
        graph_.addEdge(node.handle, child);

        if (!enqueued_.count(identity)) {
            CrawlNode next;
            next.handle = child;
            if (page) {
                next.links = page->links;
                next.page = std::move(*page);
            } else {
                next.page.title = entry.title;
                next.page.id = identity;
            }
            enqueue(identity, std::move(next));
        }
    }

    report(outcome, stats);
}

CrawlEngine::Evaluation CrawlEngine::evaluate(const IndexEntry& entry) {
    Evaluation ev;
    ev.entry = entry;
    try {
        PageRecord page = load(entry);

        if (config_.followRedirects && page.isRedirect()) {
            IndexEntry target = source_.resolve(page.redirect);
            if (target.document_id != entry.document_id) {
                redirects_[entry.document_id] = target;
                ev.entry = target;
                std::optional<bool> cached = cache_.get(target.document_id);
                if (cached) {
                    ev.positive = *cached;
                    ev.fromCache = true;
                    return ev;
                }
                page = load(target);
            }
        }

        FilterResult verdict;
        {
            Utils::ScopedTimer t("Classify");
            verdict = classifier_.classify(page);
        }
        ev.positive = verdict.keep;
        ev.reason = verdict.reason;
        ev.page = std::move(page);
    } catch (const ArticleNotFoundError& e) {
        ev.failure = LinkFailure::NotFound;
        ev.reason = e.what();
    } catch (const CorruptArchiveError& e) {
        ev.failure = LinkFailure::CorruptArchive;
        ev.reason = e.what();
    } catch (const ScanNotFoundError& e) {
        ev.failure = LinkFailure::ScanNotFound;
        ev.reason = e.what();
    } catch (const PageParseError& e) {
        ev.failure = LinkFailure::ParseError;
        ev.reason = e.what();
    } catch (const std::exception& e) {
        ev.failure = LinkFailure::Other;
        ev.reason = e.what();
    }

    if (ev.failure != LinkFailure::None) {
        ev.positive = false;
        ev.page.reset();
    }
    return ev;
}

PageRecord CrawlEngine::load(const IndexEntry& entry) {
    ExtractedDocument doc;
    {
        Utils::ScopedTimer t("Extract");
        doc = source_.retrieve(entry);
    }
    Utils::ScopedTimer t("Parse");
    return parser_.parse(doc.raw_text);
}

GraphStore::Handle CrawlEngine::registerNode(const std::string& identity, const std::string& title) {
    // The store merges identical properties, so every later registration of
    // the same identity must repeat the title it was first registered with.
    const std::string& first = nodeTitles_.emplace(identity, title).first->second;

    GraphStore::Properties props;
    props["id"] = identity;
    props["title"] = first;
    return graph_.addNode(props);
}

void CrawlEngine::enqueue(const std::string& identity, CrawlNode node) {
    enqueued_.insert(identity);
    queue_.push_back(std::move(node));
}

void CrawlEngine::report(const LinkOutcome& outcome, CrawlStats& stats) {
    if (outcome.fromCache) stats.cacheHits++;

    if (outcome.failure != LinkFailure::None) {
        stats.failures++;
        stats.failureKinds[linkFailureName(outcome.failure)]++;
        std::cerr << "Warning: link \"" << outcome.title << "\" from \"" << outcome.source
                  << "\" treated as negative (" << linkFailureName(outcome.failure) << "): " << outcome.reason
                  << std::endl;
    }

    if (outcome.accepted) {
        if (config_.verbose && !outcome.fromCache) {
            std::cout << "  Accepted [" << acceptedCount_ << "/" << config_.bound << "] " << outcome.title
                      << " (" << outcome.reason << ")" << std::endl;
        }
    } else {
        stats.rejected++;
        if (outcome.failure == LinkFailure::None && !outcome.fromCache) {
            stats.rejectReasons[outcome.reason]++;
        }
    }

    if (sink_) sink_(outcome);
}
