#include "offset_index.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Args {
    std::string listing;
    std::string output_db = "data/output/pages.db";
};

Args parseArgs(int argc, char** argv) {
    Args args;
    if (argc < 2) {
        std::cerr << "Usage: wikicrawl_build_index <multistream-index.txt[.bz2|.gz]> [out.db]\n";
        std::exit(1);
    }
    args.listing = argv[1];
    if (argc > 2) args.output_db = argv[2];
    return args;
}

} // namespace

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    Args args = parseArgs(argc, argv);

    auto start = std::chrono::high_resolution_clock::now();

    std::vector<IndexEntry> entries;
    ListingStats stats;
    try {
        if (!readListing(args.listing, entries, stats)) {
            std::cerr << "Failed to open listing: " << args.listing << "\n";
            return 1;
        }
        std::cout << "Read " << entries.size() << " entries from " << args.listing << std::endl;

        assignEndOffsets(entries);
        SqliteOffsetIndex::build(entries, args.output_db);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    std::cout << "{"
              << "\"lines\":" << stats.lines << ","
              << "\"entries\":" << entries.size() << ","
              << "\"malformed\":" << stats.malformed << ","
              << "\"truncated\":" << (stats.truncated ? "true" : "false") << ","
              << "\"elapsed_sec\":" << elapsed.count()
              << "}\n";

    return 0;
}
