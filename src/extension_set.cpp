// ============================================================================
// extension_set.cpp — Persistent set of added transitions
// ============================================================================

#include "tracefit/extension_set.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tracefit {

// Entry hashes are combined by addition so that the set hash does not
// depend on insertion order.
static std::size_t entry_hash(const Extension& e) noexcept {
    std::size_t h = StateHash{}(e.from);
    h ^= std::hash<unsigned>{}(e.input) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= StateHash{}(e.edge.to) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<char>{}(e.edge.output) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

std::optional<Edge> ExtensionSet::find(State from, InputSymbol input) const {
    for (const Node* n = head_.get(); n != nullptr; n = n->parent.get()) {
        if (n->entry.from == from && n->entry.input == input) {
            return n->entry.edge;
        }
    }
    return std::nullopt;
}

ExtensionSet ExtensionSet::with(State from, InputSymbol input, Edge edge) const {
    if (contains(from, input)) {
        throw std::logic_error("extension for input " + input_to_string(input) +
                               " already present");
    }
    auto node = std::make_shared<Node>();
    node->entry  = Extension{from, input, edge};
    node->parent = head_;
    node->size   = size() + 1;
    node->hash   = hash() + entry_hash(node->entry);
    return ExtensionSet(std::move(node));
}

std::vector<Extension> ExtensionSet::entries() const {
    std::vector<Extension> out;
    out.reserve(size());
    for (const Node* n = head_.get(); n != nullptr; n = n->parent.get()) {
        out.push_back(n->entry);
    }
    std::sort(out.begin(), out.end(), [](const Extension& a, const Extension& b) {
        if (a.from != b.from) return a.from < b.from;
        return a.input < b.input;
    });
    return out;
}

std::vector<State> ExtensionSet::destinations() const {
    std::vector<State> out;
    for (const Node* n = head_.get(); n != nullptr; n = n->parent.get()) {
        out.push_back(n->entry.edge.to);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

bool ExtensionSet::operator==(const ExtensionSet& o) const {
    if (head_ == o.head_) return true;
    if (size() != o.size() || hash() != o.hash()) return false;
    // Keys are unique, so content inclusion in one direction is equality.
    for (const Node* n = head_.get(); n != nullptr; n = n->parent.get()) {
        auto other = o.find(n->entry.from, n->entry.input);
        if (!other || !(*other == n->entry.edge)) return false;
    }
    return true;
}

}  // namespace tracefit
