#pragma once

#include "dag/dag.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dagstore {

/// Verification result for a single check.
struct VerificationResult {
    bool passed = false;
    std::string check_name;
    std::string message;
};

/// True when no result in `results` failed.
bool allPassed(const std::vector<VerificationResult>& results);

/// One line per failed check, "check_name: message".
std::string formatFailures(const std::vector<VerificationResult>& results);

/// Three-colour DFS over `ids`. `childrenOf(id)` returns the successor ids
/// of `id` as a std::vector. A grey node reached again closes a cycle.
template <typename NodeId, typename ChildrenFn>
bool hasDirectedCycle(const std::vector<NodeId>& ids, ChildrenFn childrenOf) {
    enum class Colour { White, Grey, Black };
    std::map<NodeId, Colour> colour;
    for (const NodeId& id : ids) {
        colour.emplace(id, Colour::White);
    }

    for (const NodeId& start : ids) {
        if (colour[start] != Colour::White) continue;

        // (node, children not yet visited)
        std::vector<std::pair<NodeId, std::vector<NodeId>>> stack;
        stack.emplace_back(start, childrenOf(start));
        colour[start] = Colour::Grey;
        while (!stack.empty()) {
            auto& pending = stack.back().second;
            if (pending.empty()) {
                colour[stack.back().first] = Colour::Black;
                stack.pop_back();
                continue;
            }
            NodeId child = pending.back();
            pending.pop_back();

            Colour& seen = colour[child];
            if (seen == Colour::Grey) return true;
            if (seen == Colour::White) {
                seen = Colour::Grey;
                stack.emplace_back(child, childrenOf(child));
            }
        }
    }
    return false;
}

/// Integrity Checker: audits a Dag from the outside through its public
/// queries. Endpoints, self loops, adjacency symmetry, degree sums,
/// root/leaf sets and acyclicity.
template <typename NodeId, typename NodeData, typename EdgeData>
class IntegrityChecker {
public:
    using Graph = Dag<NodeId, NodeData, EdgeData>;

    std::vector<VerificationResult> check(const Graph& graph) const {
        std::vector<VerificationResult> results;

        graph.forEachEdge([&](const NodeId& from, const NodeId& to, const EdgeData&) {
            if (!graph.containsNode(from) || !graph.containsNode(to)) {
                results.push_back({false, "edge_endpoints_exist",
                    "Edge references a node that is not in the graph"});
                return;
            }
            if (!(from < to) && !(to < from)) {
                results.push_back({false, "no_self_loop", "Edge starts and ends at the same node"});
            }
            bool mirrored = false;
            for (const NodeId& parent : parentIds(graph, to)) {
                if (!(parent < from) && !(from < parent)) mirrored = true;
            }
            if (!mirrored) {
                results.push_back({false, "adjacency_symmetric",
                    "Edge is missing from its target's parent set"});
            }
        });

        size_t in_total = 0;
        size_t out_total = 0;
        size_t zero_in = 0;
        size_t zero_out = 0;
        graph.forEachNode([&](const NodeId& id, const NodeData&) {
            for (const NodeId& parent : parentIds(graph, id)) {
                if (!graph.containsEdge(parent, id)) {
                    results.push_back({false, "adjacency_symmetric",
                        "Parent set lists an edge that does not exist"});
                }
            }
            size_t in = graph.inDegree(id);
            size_t out = graph.outDegree(id);
            in_total += in;
            out_total += out;
            if (in == 0) ++zero_in;
            if (out == 0) ++zero_out;
        });

        if (in_total != graph.edgeCount() || out_total != graph.edgeCount()) {
            results.push_back({false, "degree_sum",
                "Degree sums (in " + std::to_string(in_total) + ", out " +
                std::to_string(out_total) + ") differ from edge count " +
                std::to_string(graph.edgeCount())});
        }
        if (graph.roots().size() != zero_in) {
            results.push_back({false, "roots_match_in_degree",
                "roots() disagrees with nodes of in-degree 0"});
        }
        if (graph.leaves().size() != zero_out) {
            results.push_back({false, "leaves_match_out_degree",
                "leaves() disagrees with nodes of out-degree 0"});
        }
        auto childIds = [&graph](const NodeId& id) {
            std::vector<NodeId> ids;
            if (!graph.containsNode(id)) return ids;
            for (const auto& [child, _] : graph.children(id)) ids.push_back(child);
            return ids;
        };
        if (hasDirectedCycle(graph.getNodeIds(), childIds)) {
            results.push_back({false, "acyclic", "Edge set contains a directed cycle"});
        }

        if (results.empty()) {
            results.push_back({true, "integrity_check", "All integrity checks passed"});
        }
        return results;
    }

private:
    // Ids only: an unmatched parent entry must be reported, not dereferenced.
    static std::vector<NodeId> parentIds(const Graph& graph, const NodeId& id) {
        std::vector<NodeId> ids;
        auto parents = graph.parents(id);
        for (auto it = parents.begin(); it != parents.end(); ++it) {
            ids.push_back(it.id());
        }
        return ids;
    }
};

} // namespace dagstore
