#include "dag/dag_error.hpp"

namespace dagstore {

namespace {

const char* describe(DagErrorKind kind) {
    switch (kind) {
        case DagErrorKind::DuplicateNode: return "node id already present";
        case DagErrorKind::NodeNotFound:  return "node not found";
        case DagErrorKind::EdgeNotFound:  return "edge not found";
        case DagErrorKind::SelfLoop:      return "edge source and target are the same node";
        case DagErrorKind::DuplicateEdge: return "edge already present";
        case DagErrorKind::WouldCycle:    return "edge would create a cycle";
    }
    return "unknown error";
}

} // namespace

const char* toString(DagErrorKind kind) {
    switch (kind) {
        case DagErrorKind::DuplicateNode: return "DuplicateNode";
        case DagErrorKind::NodeNotFound:  return "NodeNotFound";
        case DagErrorKind::EdgeNotFound:  return "EdgeNotFound";
        case DagErrorKind::SelfLoop:      return "SelfLoop";
        case DagErrorKind::DuplicateEdge: return "DuplicateEdge";
        case DagErrorKind::WouldCycle:    return "WouldCycle";
    }
    return "Unknown";
}

DagError::DagError(DagErrorKind kind, const std::string& operation)
    : std::runtime_error(operation + ": " + describe(kind)),
      kind_(kind), operation_(operation) {}

} // namespace dagstore
