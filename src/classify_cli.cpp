#include "classifiers.hpp"
#include "wiki_page.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Reads one <page> document on stdin and prints the verdict.
int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    std::vector<std::string> infoboxes;
    bool showLinks = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--links") {
            showLinks = true;
        } else {
            infoboxes.push_back(arg);
        }
    }
    if (infoboxes.empty()) infoboxes.push_back("musical artist");

    std::ostringstream buffer;
    buffer << std::cin.rdbuf();

    MediaWikiPageParser parser;
    PageRecord page;
    try {
        page = parser.parse(buffer.str());
    } catch (const PageParseError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    InfoboxClassifier classifier(infoboxes);
    FilterResult res = classifier.classify(page);

    std::cout << (res.keep ? "keep" : "drop") << "\t" << res.reason << "\t" << page.title << std::endl;
    if (showLinks) {
        for (const auto& link : page.links) std::cout << link << "\n";
    }
    return 0;
}
