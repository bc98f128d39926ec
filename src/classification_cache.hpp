#pragma once

#include <optional>
#include <string>
#include <unordered_map>

// Document identity -> previously computed verdict.
class ClassificationCache {
public:
    virtual ~ClassificationCache() = default;

    // nullopt when the identity has never been classified.
    virtual std::optional<bool> get(const std::string& identity) const = 0;
    virtual void set(const std::string& identity, bool positive) = 0;
};

class MemoryClassificationCache : public ClassificationCache {
public:
    std::optional<bool> get(const std::string& identity) const override {
        auto it = verdicts_.find(identity);
        if (it == verdicts_.end()) return std::nullopt;
        return it->second;
    }

    void set(const std::string& identity, bool positive) override {
        verdicts_[identity] = positive;
    }

    size_t size() const { return verdicts_.size(); }

private:
    std::unordered_map<std::string, bool> verdicts_;
};
