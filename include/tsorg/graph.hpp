#pragma once

#include <tsorg/result.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <queue>
#include <functional>

namespace tsorg {

// ---------------------------------------------------------------------------
// Graph<NodeData>: directed graph with adjacency list
// ---------------------------------------------------------------------------

template<typename NodeData>
class Graph {
public:
    using NodeId = size_t;

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to) {
        adj_[from].push_back(to);
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (NodeId t : adj_[from]) {
            if (t == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }

    // Topological sort using Kahn's algorithm; every edge's source comes
    // before its target. Cycle error if the graph has cycles.
    Result<std::vector<NodeId>> topological_sort() const {
        size_t n = nodes_.size();
        std::vector<size_t> in_deg(n, 0);
        for (const auto& targets : adj_) {
            for (NodeId t : targets) ++in_deg[t];
        }

        std::queue<NodeId> q;
        for (size_t i = 0; i < n; ++i) {
            if (in_deg[i] == 0) q.push(i);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!q.empty()) {
            NodeId u = q.front();
            q.pop();
            order.push_back(u);
            for (NodeId t : adj_[u]) {
                if (--in_deg[t] == 0) q.push(t);
            }
        }

        if (order.size() != n) {
            return TsorgError{TsorgError::Cycle,
                "graph contains a cycle"};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    bool has_cycle() const {
        return topological_sort().is_err();
    }

    // Pre-order DFS from a starting node, each reachable node visited once
    void dfs(NodeId start,
             const std::function<void(NodeId)>& visitor) const {
        std::unordered_set<NodeId> visited;
        dfs_impl(start, visited, visitor);
    }

    // Depth-first post-order from start: every successor reachable through
    // unvisited nodes is reported before the node itself. `visited` is
    // shared across calls so repeated walks emit each node once. Successors
    // are followed in edge insertion order.
    void dfs_postorder(NodeId start,
                       std::unordered_set<NodeId>& visited,
                       const std::function<void(NodeId)>& visitor) const {
        if (!visited.insert(start).second) return;
        for (NodeId t : adj_[start]) {
            dfs_postorder(t, visited, visitor);
        }
        visitor(start);
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<NodeId>> adj_;

    void dfs_impl(NodeId u,
                  std::unordered_set<NodeId>& visited,
                  const std::function<void(NodeId)>& visitor) const {
        if (!visited.insert(u).second) return;
        visitor(u);
        for (NodeId t : adj_[u]) {
            dfs_impl(t, visited, visitor);
        }
    }
};

// ---------------------------------------------------------------------------
// GraphMap: graph keyed by declaration name
// ---------------------------------------------------------------------------

class GraphMap {
public:
    using NodeId = Graph<std::string>::NodeId;

    NodeId add_node(const std::string& name) {
        auto it = name_to_id_.find(name);
        if (it != name_to_id_.end()) return it->second;
        NodeId id = graph_.add_node(name);
        name_to_id_[name] = id;
        return id;
    }

    bool has_node(const std::string& name) const {
        return name_to_id_.count(name) > 0;
    }

    NodeId node_id(const std::string& name) const {
        return name_to_id_.at(name);
    }

    // Duplicate edges are ignored
    void add_edge(const std::string& from, const std::string& to) {
        NodeId f = add_node(from);
        NodeId t = add_node(to);
        if (!graph_.has_edge(f, t)) graph_.add_edge(f, t);
    }

    // Names reachable from `name` (excluding itself)
    std::vector<std::string> reachable(const std::string& name) const {
        std::vector<std::string> out;
        auto it = name_to_id_.find(name);
        if (it == name_to_id_.end()) return out;
        graph_.dfs(it->second, [&](NodeId id) {
            if (id != it->second) out.push_back(graph_.node(id));
        });
        return out;
    }

    bool has_cycle() const { return graph_.has_cycle(); }

    size_t node_count() const { return graph_.node_count(); }

    const Graph<std::string>& inner() const { return graph_; }

private:
    Graph<std::string> graph_;
    std::unordered_map<std::string, NodeId> name_to_id_;
};

} // namespace tsorg
