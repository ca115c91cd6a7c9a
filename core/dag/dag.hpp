#pragma once

#include "dag/dag_error.hpp"
#include "dag/dag_ranges.hpp"
#include "logging/logging.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <type_traits>
#include <utility>
#include <vector>

namespace dagstore {

/// What removeNode() hands back: the node payload and the payloads of the
/// edges removed with it (outgoing edges first, then incoming).
template <typename NodeData, typename EdgeData>
struct RemovedNode {
    NodeData data;
    std::vector<EdgeData> edges;
};

// ─── Dag ───────────────────────────────────────────────────────
// Directed acyclic graph with a payload on every node and edge.
// Nodes are keyed by caller-supplied ids (ordered by operator<); edges by
// the (from, to) pair. Relationships are id lookups only:
//   nodes_    : id → node payload
//   outgoing_ : id → (target id → edge payload)
//   incoming_ : id → source ids
// Every mutation either succeeds or throws DagError with the graph unchanged.
// Iteration is in ascending id order.

template <typename NodeId, typename NodeData, typename EdgeData>
class Dag {
public:
    using NodeMap = std::map<NodeId, NodeData>;
    using EdgeMap = std::map<NodeId, EdgeData>;
    using OutgoingMap = std::map<NodeId, EdgeMap>;
    using IncomingMap = std::map<NodeId, std::set<NodeId>>;

    using RootRange = Range<detail::FilterIterator<NodeMap, detail::NoNeighbours<IncomingMap>>>;
    using LeafRange = Range<detail::FilterIterator<NodeMap, detail::NoNeighbours<OutgoingMap>>>;
    using ChildRange = Range<typename EdgeMap::const_iterator>;
    using ParentRange = Range<detail::ParentIterator<NodeId, EdgeData>>;

    Dag() = default;

    // ── Node operations ──

    /// Throws DuplicateNode if `id` is already present.
    void insertNode(const NodeId& id, NodeData data) {
        if (nodes_.count(id)) reject("insertNode", DagErrorKind::DuplicateNode);

        auto out = outgoing_.emplace(id, EdgeMap{}).first;
        auto in = incoming_.end();
        try {
            in = incoming_.emplace(id, std::set<NodeId>{}).first;
            nodes_.emplace(id, std::move(data));
        } catch (...) {
            if (in != incoming_.end()) incoming_.erase(in);
            outgoing_.erase(out);
            throw;
        }
        detail::logMutation("insertNode", nodes_.size(), edge_count_);
    }

    /// Removes the node and every edge touching it.
    /// Throws NodeNotFound if absent. If copying a payload throws, the graph
    /// is left as it was.
    RemovedNode<NodeData, EdgeData> removeNode(const NodeId& id) {
        auto node = nodes_.find(id);
        if (node == nodes_.end()) reject("removeNode", DagErrorKind::NodeNotFound);

        auto out = outgoing_.find(id);
        auto in = incoming_.find(id);

        // Collect payloads without touching the structure.
        std::vector<EdgeData> edges;
        edges.reserve(out->second.size() + in->second.size());
        for (auto& entry : out->second) {
            edges.push_back(take(entry.second));
        }
        for (const NodeId& parent : in->second) {
            edges.push_back(take(outgoing_.find(parent)->second.find(id)->second));
        }
        RemovedNode<NodeData, EdgeData> removed{take(node->second), std::move(edges)};

        // Detach; nothing below throws.
        for (const auto& entry : out->second) {
            incoming_.find(entry.first)->second.erase(id);
        }
        for (const NodeId& parent : in->second) {
            outgoing_.find(parent)->second.erase(id);
        }
        edge_count_ -= removed.edges.size();
        outgoing_.erase(out);
        incoming_.erase(in);
        nodes_.erase(node);

        detail::logMutation("removeNode", nodes_.size(), edge_count_);
        return removed;
    }

    bool containsNode(const NodeId& id) const { return nodes_.count(id) > 0; }

    NodeData* getNode(const NodeId& id) {
        auto it = nodes_.find(id);
        return it != nodes_.end() ? &it->second : nullptr;
    }

    const NodeData* getNode(const NodeId& id) const {
        auto it = nodes_.find(id);
        return it != nodes_.end() ? &it->second : nullptr;
    }

    std::vector<NodeId> getNodeIds() const {
        std::vector<NodeId> ids;
        ids.reserve(nodes_.size());
        for (const auto& [id, _] : nodes_) {
            ids.push_back(id);
        }
        return ids;
    }

    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──

    /// Adds the edge from → to. Checked in order: SelfLoop, NodeNotFound,
    /// DuplicateEdge, WouldCycle.
    void insertEdge(const NodeId& from, const NodeId& to, EdgeData data) {
        if (sameNode(from, to)) reject("insertEdge", DagErrorKind::SelfLoop);
        if (!containsNode(from) || !containsNode(to)) {
            reject("insertEdge", DagErrorKind::NodeNotFound);
        }

        EdgeMap& targets = outgoing_.find(from)->second;
        if (targets.count(to)) reject("insertEdge", DagErrorKind::DuplicateEdge);

        // from → to closes a cycle iff `from` is already reachable from `to`.
        if (reaches(to, from)) reject("insertEdge", DagErrorKind::WouldCycle);

        auto edge = targets.emplace(to, std::move(data)).first;
        try {
            incoming_.find(to)->second.insert(from);
        } catch (...) {
            targets.erase(edge);
            throw;
        }
        ++edge_count_;
        detail::logMutation("insertEdge", nodes_.size(), edge_count_);
    }

    /// Throws EdgeNotFound if there is no edge from → to.
    EdgeData removeEdge(const NodeId& from, const NodeId& to) {
        auto out = outgoing_.find(from);
        if (out == outgoing_.end()) reject("removeEdge", DagErrorKind::EdgeNotFound);
        auto edge = out->second.find(to);
        if (edge == out->second.end()) reject("removeEdge", DagErrorKind::EdgeNotFound);

        EdgeData data = std::move(edge->second);
        out->second.erase(edge);
        incoming_.find(to)->second.erase(from);
        --edge_count_;

        detail::logMutation("removeEdge", nodes_.size(), edge_count_);
        return data;
    }

    bool containsEdge(const NodeId& from, const NodeId& to) const {
        auto out = outgoing_.find(from);
        return out != outgoing_.end() && out->second.count(to) > 0;
    }

    EdgeData* getEdge(const NodeId& from, const NodeId& to) {
        auto out = outgoing_.find(from);
        if (out == outgoing_.end()) return nullptr;
        auto edge = out->second.find(to);
        return edge != out->second.end() ? &edge->second : nullptr;
    }

    const EdgeData* getEdge(const NodeId& from, const NodeId& to) const {
        auto out = outgoing_.find(from);
        if (out == outgoing_.end()) return nullptr;
        auto edge = out->second.find(to);
        return edge != out->second.end() ? &edge->second : nullptr;
    }

    size_t edgeCount() const { return edge_count_; }

    bool empty() const { return nodes_.empty(); }

    // ── Structural queries ──

    /// Nodes without incoming edges, as (id, node payload).
    RootRange roots() const {
        detail::NoNeighbours<IncomingMap> pred{&incoming_};
        return RootRange(
            {nodes_.begin(), nodes_.end(), pred},
            {nodes_.end(), nodes_.end(), pred});
    }

    /// Nodes without outgoing edges, as (id, node payload).
    LeafRange leaves() const {
        detail::NoNeighbours<OutgoingMap> pred{&outgoing_};
        return LeafRange(
            {nodes_.begin(), nodes_.end(), pred},
            {nodes_.end(), nodes_.end(), pred});
    }

    /// Direct successors as (child id, edge payload).
    /// Throws NodeNotFound if `id` is absent.
    ChildRange children(const NodeId& id) const {
        auto out = outgoing_.find(id);
        if (out == outgoing_.end()) reject("children", DagErrorKind::NodeNotFound);
        return ChildRange(out->second.begin(), out->second.end());
    }

    /// Direct predecessors as (parent id, edge payload).
    /// Throws NodeNotFound if `id` is absent.
    ParentRange parents(const NodeId& id) const {
        auto in = incoming_.find(id);
        if (in == incoming_.end()) reject("parents", DagErrorKind::NodeNotFound);
        const NodeId* child = &in->first;
        return ParentRange(
            {in->second.begin(), child, &outgoing_},
            {in->second.end(), child, &outgoing_});
    }

    size_t inDegree(const NodeId& id) const {
        auto in = incoming_.find(id);
        if (in == incoming_.end()) reject("inDegree", DagErrorKind::NodeNotFound);
        return in->second.size();
    }

    size_t outDegree(const NodeId& id) const {
        auto out = outgoing_.find(id);
        if (out == outgoing_.end()) reject("outDegree", DagErrorKind::NodeNotFound);
        return out->second.size();
    }

    // ── Iteration ──

    void forEachNode(const std::function<void(const NodeId&, const NodeData&)>& fn) const {
        for (const auto& [id, data] : nodes_) {
            fn(id, data);
        }
    }

    /// Edges ordered by source, then target.
    void forEachEdge(
        const std::function<void(const NodeId&, const NodeId&, const EdgeData&)>& fn) const {
        for (const auto& [from, targets] : outgoing_) {
            for (const auto& [to, data] : targets) {
                fn(from, to, data);
            }
        }
    }

    /// Visits every node with a writable payload. Structure cannot change.
    void forEachNodeMutable(const std::function<void(const NodeId&, NodeData&)>& fn) {
        for (auto& [id, data] : nodes_) {
            fn(id, data);
        }
    }

    void forEachEdgeMutable(
        const std::function<void(const NodeId&, const NodeId&, EdgeData&)>& fn) {
        for (auto& [from, targets] : outgoing_) {
            for (auto& [to, data] : targets) {
                fn(from, to, data);
            }
        }
    }

    // ── Subgraph extraction ──

    /// The sub-DAG induced by `ids`. Ids not in the graph are ignored.
    Dag extractSubgraph(const std::set<NodeId>& ids) const {
        Dag sub;
        for (const NodeId& id : ids) {
            auto node = nodes_.find(id);
            if (node == nodes_.end()) continue;
            sub.nodes_.emplace(id, node->second);
            sub.outgoing_.emplace(id, EdgeMap{});
            sub.incoming_.emplace(id, std::set<NodeId>{});
        }
        for (auto& [from, targets] : sub.outgoing_) {
            for (const auto& [to, data] : outgoing_.find(from)->second) {
                if (!sub.nodes_.count(to)) continue;
                targets.emplace(to, data);
                sub.incoming_[to].insert(from);
                ++sub.edge_count_;
            }
        }
        return sub;
    }

    // ── Cloning ──

    Dag clone() const { return *this; }

    void clear() {
        nodes_.clear();
        outgoing_.clear();
        incoming_.clear();
        edge_count_ = 0;
    }

    bool operator==(const Dag& other) const {
        return nodes_ == other.nodes_ && outgoing_ == other.outgoing_ &&
               incoming_ == other.incoming_;
    }
    bool operator!=(const Dag& other) const { return !(*this == other); }

private:
    // Payloads leave the graph by move only when no move can throw;
    // otherwise they are copied so a failure leaves the graph intact.
    static constexpr bool kNothrowTake =
        std::is_nothrow_move_constructible<NodeData>::value &&
        std::is_nothrow_move_constructible<EdgeData>::value;

    template <typename T>
    static T take(T& value) {
        if constexpr (kNothrowTake || !std::is_copy_constructible<T>::value) {
            return std::move(value);
        } else {
            return value;
        }
    }

    [[noreturn]] static void reject(const char* operation, DagErrorKind kind) {
        detail::logRejected(operation, kind);
        throw DagError(kind, operation);
    }

    static bool sameNode(const NodeId& a, const NodeId& b) {
        return !(a < b) && !(b < a);
    }

    // Iterative DFS along outgoing edges.
    bool reaches(const NodeId& start, const NodeId& target) const {
        std::set<NodeId> visited;
        std::vector<NodeId> stack{start};
        while (!stack.empty()) {
            NodeId top = stack.back();
            stack.pop_back();
            if (sameNode(top, target)) return true;
            if (!visited.insert(top).second) continue;

            for (const auto& [child, _] : outgoing_.find(top)->second) {
                if (!visited.count(child)) stack.push_back(child);
            }
        }
        return false;
    }

    NodeMap nodes_;
    OutgoingMap outgoing_;
    IncomingMap incoming_;
    size_t edge_count_ = 0;
};

} // namespace dagstore
