#include "archive_errors.hpp"
#include "archive_extractor.hpp"
#include "classification_cache.hpp"
#include "classifiers.hpp"
#include "crawl_engine.hpp"
#include "graph_store.hpp"
#include "offset_index.hpp"
#include "utils.hpp"
#include "wiki_page.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

struct Args {
    std::string archive_file = "data/input/enwiki-20200201-pages-articles-multistream.xml.bz2";
    std::string index_db = "data/output/pages.db";
    std::string seeds_file;
    std::vector<std::string> seeds;
    std::vector<std::string> infoboxes;
    std::string output_dir = "data/output";
    std::string log_csv_file;
    size_t bound = 150;
    size_t cache_size = 64;
    bool follow_redirects = true;
    bool quiet = false;
};

void printUsage() {
    std::cerr << "Usage: wikicrawl [--archive file.xml.bz2] [--index pages.db] [--seeds file] [--bound N]\n"
              << "                 [--infobox NAME]... [--output-dir DIR] [--log-csv file] [--cache-size N]\n"
              << "                 [--no-redirects] [--quiet] [seed title]..." << std::endl;
}

Args parseArgs(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--archive" && i + 1 < argc) {
            args.archive_file = argv[++i];
        } else if (arg == "--index" && i + 1 < argc) {
            args.index_db = argv[++i];
        } else if (arg == "--seeds" && i + 1 < argc) {
            args.seeds_file = argv[++i];
        } else if (arg == "--bound" && i + 1 < argc) {
            args.bound = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--infobox" && i + 1 < argc) {
            args.infoboxes.push_back(argv[++i]);
        } else if (arg == "--output-dir" && i + 1 < argc) {
            args.output_dir = argv[++i];
        } else if (arg == "--log-csv" && i + 1 < argc) {
            args.log_csv_file = argv[++i];
        } else if (arg == "--cache-size" && i + 1 < argc) {
            args.cache_size = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--no-redirects") {
            args.follow_redirects = false;
        } else if (arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (arg[0] != '-') {
            args.seeds.push_back(arg);
        } else {
            std::cerr << "Warning: ignoring unknown option " << arg << std::endl;
        }
    }
    return args;
}

// One title per line; blank lines and '#' comments are skipped.
bool loadSeeds(const std::string& path, std::vector<std::string>& seeds) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    for (const auto& line : Utils::splitLines(buffer.str())) {
        std::string title = Utils::trim(line);
        if (title.empty() || title[0] == '#') continue;
        seeds.push_back(title);
    }
    return true;
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    Args args;
    try {
        args = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid argument: " << e.what() << std::endl;
        printUsage();
        return 1;
    }

    if (!args.seeds_file.empty() && !loadSeeds(args.seeds_file, args.seeds)) {
        std::cerr << "Error: Could not open seed file " << args.seeds_file << std::endl;
        return 1;
    }
    if (args.seeds.empty()) {
        std::cerr << "Error: no seed titles given" << std::endl;
        printUsage();
        return 1;
    }
    if (args.infoboxes.empty()) args.infoboxes.push_back("musical artist");

    std::shared_ptr<const OffsetIndex> index;
    std::unique_ptr<ArchiveExtractor> extractor;
    try {
        index = std::make_shared<SqliteOffsetIndex>(args.index_db);
        extractor.reset(new ArchiveExtractor(args.archive_file, index, args.cache_size));
    } catch (const ConstructionError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::ofstream csvOut;
    if (!args.log_csv_file.empty()) {
        csvOut.open(args.log_csv_file);
        if (csvOut.is_open()) {
            csvOut << "source,link,identity,status,cached,failure,reason\n";
        } else {
            std::cerr << "Error: Could not open CSV output file " << args.log_csv_file << std::endl;
        }
    }

    MediaWikiPageParser parser;
    InfoboxClassifier classifier(args.infoboxes);
    MemoryClassificationCache cache;
    MemoryGraphStore graph;

    CrawlConfig config;
    config.bound = args.bound;
    config.followRedirects = args.follow_redirects;
    config.verbose = !args.quiet;

    CrawlEngine engine(*extractor, parser, classifier, cache, graph, config);
    if (csvOut.is_open()) {
        engine.setOutcomeSink([&csvOut](const LinkOutcome& o) {
            csvOut << Utils::csvField(o.source) << "," << Utils::csvField(o.title) << "," << o.identity << ","
                   << (o.accepted ? "accepted" : "rejected") << "," << (o.fromCache ? "yes" : "no") << ","
                   << linkFailureName(o.failure) << "," << Utils::csvField(o.reason) << "\n";
        });
    }

    std::cout << "Crawling " << args.seeds.size() << " seed(s) in " << args.archive_file << " ("
              << codecName(extractor->codec()) << "), bound " << args.bound << std::endl;

    auto startTime = std::chrono::high_resolution_clock::now();
    CrawlStats stats = engine.run(args.seeds);
    auto endTime = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = endTime - startTime;

    std::string nodesPath = args.output_dir + "/nodes.csv";
    std::string edgesPath = args.output_dir + "/edges.csv";
    bool written = graph.writeCsv(nodesPath, edgesPath);

    std::cout << "Crawl completed in " << elapsed.count() << " seconds." << std::endl;
    std::cout << "Seeds: " << stats.seedsRegistered << " registered, " << stats.seedFailures << " failed" << std::endl;
    std::cout << "Nodes Expanded: " << stats.nodesVisited << std::endl;
    std::cout << "Nodes Skipped: " << stats.nodesSkipped << std::endl;
    std::cout << "Links Seen: " << stats.linksSeen << std::endl;
    std::cout << "Cache Hits: " << stats.cacheHits << std::endl;
    std::cout << "Accepted: " << stats.accepted << (stats.boundReached ? " (bound reached)" : " (queue drained)")
              << std::endl;
    std::cout << "Rejected: " << stats.rejected << std::endl;
    std::cout << "Graph: " << graph.nodeCount() << " nodes, " << graph.edgeCount() << " edges" << std::endl;
    if (written) {
        std::cout << "Graph written to " << nodesPath << " and " << edgesPath << std::endl;
    }

    std::cout << "\nReject Reasons:" << std::endl;
    for (const auto& pair : stats.rejectReasons) {
        std::cout << "  " << pair.first << ": " << pair.second << std::endl;
    }
    if (!stats.failureKinds.empty()) {
        std::cout << "\nFailures:" << std::endl;
        for (const auto& pair : stats.failureKinds) {
            std::cout << "  " << pair.first << ": " << pair.second << std::endl;
        }
    }

    Utils::Profiler::instance().printStats();

    return stats.seedsRegistered > 0 && written ? 0 : 1;
}
