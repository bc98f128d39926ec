#pragma once

#include "wiki_page.hpp"

#include <string>
#include <unordered_set>
#include <vector>

struct FilterResult {
    bool keep;
    std::string reason;
};

class PageClassifier {
public:
    virtual ~PageClassifier() = default;
    virtual FilterResult classify(const PageRecord& page) const = 0;
};

// Keeps main-namespace articles that carry one of the configured infoboxes.
class InfoboxClassifier : public PageClassifier {
public:
    explicit InfoboxClassifier(const std::vector<std::string>& infoboxNames = {"musical artist"},
                               bool articlesOnly = true);

    FilterResult classify(const PageRecord& page) const override;

    const std::unordered_set<std::string>& names() const { return names_; }

private:
    std::unordered_set<std::string> names_;
    bool articles_only_;
};
