#pragma once

#include <stdexcept>
#include <string>

namespace dagstore {

/// Closed set of reasons a DAG operation can be rejected.
enum class DagErrorKind {
    DuplicateNode,
    NodeNotFound,
    EdgeNotFound,
    SelfLoop,
    DuplicateEdge,
    WouldCycle,
};

/// Name of the kind, e.g. "WouldCycle".
const char* toString(DagErrorKind kind);

/// Thrown by every fallible Dag operation. The graph is left exactly as it
/// was before the call.
class DagError : public std::runtime_error {
public:
    DagError(DagErrorKind kind, const std::string& operation);

    DagErrorKind kind() const { return kind_; }
    const std::string& operation() const { return operation_; }

private:
    DagErrorKind kind_;
    std::string operation_;
};

} // namespace dagstore
