#include "archive_errors.hpp"
#include "archive_extractor.hpp"
#include "offset_index.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

struct Args {
    std::string title;
    std::string archive_file = "data/input/enwiki-20200201-pages-articles-multistream.xml.bz2";
    std::string index_db = "data/output/pages.db";
    std::string output_file;
    bool profile = false;
};

Args parseArgs(int argc, char** argv) {
    Args args;
    if (argc < 2) {
        std::cerr << "Usage: wikicrawl_extract <title> [--archive file] [--index pages.db] [--output file] [--profile]"
                  << std::endl;
        std::exit(1);
    }
    args.title = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--archive" && i + 1 < argc) {
            args.archive_file = argv[++i];
        } else if (arg == "--index" && i + 1 < argc) {
            args.index_db = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_file = argv[++i];
        } else if (arg == "--profile") {
            args.profile = true;
        }
    }
    return args;
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    Args args = parseArgs(argc, argv);

    ExtractedDocument doc;
    try {
        auto index = std::make_shared<SqliteOffsetIndex>(args.index_db);
        ArchiveExtractor extractor(args.archive_file, index, 0);
        doc = extractor.retrieve(args.title);
    } catch (const ConstructionError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const ArchiveError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::ostream* out = &std::cout;
    std::ofstream fout;
    if (!args.output_file.empty()) {
        fout.open(args.output_file, std::ios::binary);
        if (!fout.is_open()) {
            std::cerr << "Failed to open output file: " << args.output_file << std::endl;
            return 1;
        }
        out = &fout;
    }

    (*out) << doc.raw_text;
    if (args.output_file.empty()) (*out) << "\n";
    out->flush();

    std::cerr << "Extracted page " << doc.document_id << " (" << doc.raw_text.size() << " bytes)" << std::endl;
    if (args.profile) Utils::Profiler::instance().printStats(std::cerr);
    return 0;
}
