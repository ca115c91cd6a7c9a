#pragma once

#include <cstddef>
#include <iterator>
#include <map>
#include <set>
#include <utility>

namespace dagstore {

/// A pair of iterators usable in range-for. Views are evaluated lazily and
/// are invalidated by any mutation of the graph they came from.
template <typename Iterator>
class Range {
public:
    Range(Iterator first, Iterator last)
        : first_(std::move(first)), last_(std::move(last)) {}

    Iterator begin() const { return first_; }
    Iterator end() const { return last_; }

    bool empty() const { return first_ == last_; }
    size_t size() const { return static_cast<size_t>(std::distance(first_, last_)); }

private:
    Iterator first_;
    Iterator last_;
};

namespace detail {

// Accepts map entries whose key has no neighbours in `adjacency`.
template <typename AdjacencyMap>
struct NoNeighbours {
    const AdjacencyMap* adjacency = nullptr;

    template <typename Entry>
    bool operator()(const Entry& entry) const {
        auto it = adjacency->find(entry.first);
        return it == adjacency->end() || it->second.empty();
    }
};

/// Walks a map, yielding only the entries accepted by `Pred`.
template <typename Map, typename Pred>
class FilterIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = typename Map::value_type;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    FilterIterator() = default;
    FilterIterator(typename Map::const_iterator it, typename Map::const_iterator end, Pred pred)
        : it_(it), end_(end), pred_(pred) {
        skip();
    }

    reference operator*() const { return *it_; }
    pointer operator->() const { return &*it_; }

    FilterIterator& operator++() {
        ++it_;
        skip();
        return *this;
    }

    FilterIterator operator++(int) {
        FilterIterator copy = *this;
        ++*this;
        return copy;
    }

    bool operator==(const FilterIterator& other) const { return it_ == other.it_; }
    bool operator!=(const FilterIterator& other) const { return it_ != other.it_; }

private:
    void skip() {
        while (it_ != end_ && !pred_(*it_)) ++it_;
    }

    typename Map::const_iterator it_{};
    typename Map::const_iterator end_{};
    Pred pred_{};
};

/// Walks the parent set of one node, pairing each parent id with the
/// payload of the edge parent -> child.
template <typename NodeId, typename EdgeData>
class ParentIterator {
public:
    using OutgoingMap = std::map<NodeId, std::map<NodeId, EdgeData>>;

    using iterator_category = std::input_iterator_tag;
    using value_type = std::pair<const NodeId&, const EdgeData&>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = value_type;

    ParentIterator() = default;
    ParentIterator(typename std::set<NodeId>::const_iterator it,
                   const NodeId* child, const OutgoingMap* outgoing)
        : it_(it), child_(child), outgoing_(outgoing) {}

    reference operator*() const {
        return {*it_, outgoing_->find(*it_)->second.find(*child_)->second};
    }

    /// The parent id alone, without looking up the edge payload.
    const NodeId& id() const { return *it_; }

    ParentIterator& operator++() {
        ++it_;
        return *this;
    }

    ParentIterator operator++(int) {
        ParentIterator copy = *this;
        ++it_;
        return copy;
    }

    bool operator==(const ParentIterator& other) const { return it_ == other.it_; }
    bool operator!=(const ParentIterator& other) const { return it_ != other.it_; }

private:
    typename std::set<NodeId>::const_iterator it_{};
    const NodeId* child_ = nullptr;
    const OutgoingMap* outgoing_ = nullptr;
};

} // namespace detail

} // namespace dagstore
