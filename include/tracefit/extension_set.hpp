// ============================================================================
// tracefit/extension_set.hpp — Persistent set of added transitions
// ============================================================================
//
// An ExtensionSet maps (state, input) to the edge that the search added for
// it.  Values are immutable snapshots: with() returns a new set that shares
// every existing entry with its parent, so sibling search branches can
// extend the same snapshot independently without copying it.
//
// Equality and hashing depend only on the logical content, never on the
// order in which entries were added.  Two branches that added the same
// transitions in a different order therefore produce equal memo keys.
//
// ============================================================================

#ifndef TRACEFIT_EXTENSION_SET_HPP
#define TRACEFIT_EXTENSION_SET_HPP

#include "tracefit/transducer.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace tracefit {

// ── Extension ───────────────────────────────────────────────────────────────

struct Extension {
    State       from;
    InputSymbol input = 0;
    Edge        edge;
};

// ── ExtensionSet ────────────────────────────────────────────────────────────

class ExtensionSet {
public:
    ExtensionSet() = default;

    /// Edge added for (from, input), if any.
    std::optional<Edge> find(State from, InputSymbol input) const;

    bool contains(State from, InputSymbol input) const {
        return find(from, input).has_value();
    }

    /// A new snapshot with one more entry.  Throws std::logic_error if
    /// (from, input) is already present; entries are never overwritten.
    ExtensionSet with(State from, InputSymbol input, Edge edge) const;

    std::size_t size() const noexcept { return head_ ? head_->size : 0; }
    bool empty() const noexcept { return head_ == nullptr; }

    /// Order-independent content hash.
    std::size_t hash() const noexcept { return head_ ? head_->hash : 0; }

    /// Entries sorted by (from, input).
    std::vector<Extension> entries() const;

    /// Sorted, de-duplicated destinations of all entries.
    std::vector<State> destinations() const;

    bool operator==(const ExtensionSet& o) const;
    bool operator!=(const ExtensionSet& o) const { return !(*this == o); }

private:
    struct Node {
        Extension                   entry;
        std::shared_ptr<const Node> parent;
        std::size_t                 size = 0;
        std::size_t                 hash = 0;
    };

    explicit ExtensionSet(std::shared_ptr<const Node> head) : head_(std::move(head)) {}

    std::shared_ptr<const Node> head_;
};

struct ExtensionSetHash {
    std::size_t operator()(const ExtensionSet& s) const noexcept { return s.hash(); }
};

}  // namespace tracefit

#endif  // TRACEFIT_EXTENSION_SET_HPP
