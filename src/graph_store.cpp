#include "graph_store.hpp"
#include "utils.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

GraphStore::Handle MemoryGraphStore::addNode(const Properties& properties) {
    auto it = handles_.find(properties);
    if (it != handles_.end()) return it->second;

    Handle handle = nodes_.size();
    nodes_.push_back(properties);
    handles_.emplace(properties, handle);
    return handle;
}

void MemoryGraphStore::addEdge(Handle from, Handle to) {
    if (from >= nodes_.size() || to >= nodes_.size()) {
        throw std::out_of_range("Edge " + std::to_string(from) + " -> " + std::to_string(to) +
                                " references an unknown node");
    }
    if (edgeSet_.insert({from, to}).second) {
        edges_.emplace_back(from, to);
    }
}

const GraphStore::Properties& MemoryGraphStore::node(Handle handle) const {
    if (handle >= nodes_.size()) {
        throw std::out_of_range("Unknown node handle " + std::to_string(handle));
    }
    return nodes_[handle];
}

bool MemoryGraphStore::findById(const std::string& id, Handle& out) const {
    for (Handle h = 0; h < nodes_.size(); ++h) {
        auto it = nodes_[h].find("id");
        if (it != nodes_[h].end() && it->second == id) {
            out = h;
            return true;
        }
    }
    return false;
}

void MemoryGraphStore::clear() {
    nodes_.clear();
    handles_.clear();
    edges_.clear();
    edgeSet_.clear();
}

bool MemoryGraphStore::writeCsv(const std::string& nodesPath, const std::string& edgesPath) const {
    std::set<std::string> keys;
    for (const auto& props : nodes_) {
        for (const auto& kv : props) keys.insert(kv.first);
    }

    std::ofstream nodesOut(nodesPath);
    if (!nodesOut.is_open()) {
        std::cerr << "Error: Could not open node output file " << nodesPath << std::endl;
        return false;
    }
    nodesOut << "handle";
    for (const auto& key : keys) nodesOut << "," << Utils::csvField(key);
    nodesOut << "\n";
    for (Handle h = 0; h < nodes_.size(); ++h) {
        nodesOut << h;
        for (const auto& key : keys) {
            auto it = nodes_[h].find(key);
            nodesOut << "," << (it == nodes_[h].end() ? "" : Utils::csvField(it->second));
        }
        nodesOut << "\n";
    }

    std::ofstream edgesOut(edgesPath);
    if (!edgesOut.is_open()) {
        std::cerr << "Error: Could not open edge output file " << edgesPath << std::endl;
        return false;
    }
    edgesOut << "from,to\n";
    for (const auto& e : edges_) {
        edgesOut << e.first << "," << e.second << "\n";
    }
    return nodesOut.good() && edgesOut.good();
}
