#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

class GraphStore {
public:
    using Handle = uint64_t;
    using Properties = std::map<std::string, std::string>;

    virtual ~GraphStore() = default;

    // Identical property sets resolve to the same handle.
    virtual Handle addNode(const Properties& properties) = 0;
    // Registering an existing edge again is a no-op.
    virtual void addEdge(Handle from, Handle to) = 0;
};

class MemoryGraphStore : public GraphStore {
public:
    Handle addNode(const Properties& properties) override;
    // Throws std::out_of_range for unknown handles.
    void addEdge(Handle from, Handle to) override;

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    const Properties& node(Handle handle) const;
    const std::vector<std::pair<Handle, Handle>>& edges() const { return edges_; }
    bool hasEdge(Handle from, Handle to) const { return edgeSet_.count({from, to}) > 0; }

    // Node with the given "id" property, if any.
    bool findById(const std::string& id, Handle& out) const;

    void clear();

    // nodes.csv: handle plus one column per property key; edges.csv: from,to.
    // Returns false if either file cannot be written.
    bool writeCsv(const std::string& nodesPath, const std::string& edgesPath) const;

private:
    std::vector<Properties> nodes_;
    std::map<Properties, Handle> handles_;
    std::vector<std::pair<Handle, Handle>> edges_;
    std::set<std::pair<Handle, Handle>> edgeSet_;
};
