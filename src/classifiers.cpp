#include "classifiers.hpp"
#include "utils.hpp"

InfoboxClassifier::InfoboxClassifier(const std::vector<std::string>& infoboxNames, bool articlesOnly)
    : articles_only_(articlesOnly) {
    for (const auto& name : infoboxNames) {
        std::string normalized = Utils::toLower(Utils::trim(name));
        for (char& c : normalized) {
            if (c == '_') c = ' ';
        }
        if (!normalized.empty()) names_.insert(normalized);
    }
}

FilterResult InfoboxClassifier::classify(const PageRecord& page) const {
    if (page.isRedirect()) {
        return {false, "redirect"};
    }
    if (articles_only_ && !page.ns.empty() && page.ns != "0") {
        return {false, "namespace_" + page.ns};
    }
    if (page.infoboxes.empty()) {
        return {false, "no_infobox"};
    }
    for (const auto& box : page.infoboxes) {
        if (names_.count(box)) {
            return {true, "infobox:" + box};
        }
    }
    return {false, "infobox_mismatch"};
}
