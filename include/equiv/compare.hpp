// Structural equivalence comparer (recursive dispatch + loose sequence matching)
#pragma once
#include "equiv/graph.hpp"
#include "equiv/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace equiv {

// Route from the graph root to the current node: member names, "Element [i]",
// "Count", with " [Type]" appended to a segment once its node's type is resolved.
using ComparisonPath = std::vector<std::string>;

// Placeholder pushed when the root node's type annotation needs a segment.
inline constexpr const char* kRootSegment = "root";

// Segments joined with '.', e.g. "root [Order].Lines [vector].Element [2] [Line]".
std::string render_path(const ComparisonPath& path);

enum class MismatchKind { NullMismatch, TypeMismatch, CountMismatch, ValueMismatch, MissingMember };

const char* mismatch_code(MismatchKind k);
const char* mismatch_name(MismatchKind k);

// First point of divergence found by the comparer.
struct Mismatch {
    MismatchKind kind;
    node_ptr actual;
    node_ptr expected;
    ComparisonPath path;
    std::string actual_type;   // TypeMismatch only
    std::string expected_type; // TypeMismatch only
};

struct CompareResult {
    bool success = true;
    std::optional<Mismatch> mismatch;
    explicit operator bool() const { return success; }
    static CompareResult ok(){ return CompareResult{}; }
    static CompareResult fail(Mismatch m){ return CompareResult{false, std::move(m)}; }
};

struct CompareOptions {
    TypePolicy policy = TypePolicy::Permissive;
    bool trace = false; // [equiv][trace] lines on llvm::errs()
};

class EquivalenceComparer {
public:
    explicit EquivalenceComparer(CompareOptions opts = CompareOptions{}): opts_(opts){}

    // Compare two graphs. Holds no state between calls.
    CompareResult compare(const node_ptr& actual, const node_ptr& expected) const;

    const CompareOptions& options() const { return opts_; }

private:
    CompareOptions opts_;

    CompareResult compare_objects(const node_ptr& actual, const node_ptr& expected, ComparisonPath path) const;
    CompareResult compare_values(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const;
    CompareResult compare_references(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const;
    CompareResult compare_strings(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const;
    CompareResult compare_sequences(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const;
    // Tries expected_item against each remaining actual index; consumes the first match.
    CompareResult loose_match(std::vector<size_t>& unmatched, const std::vector<node_ptr>& actual_items,
                              const node_ptr& expected_item, const ComparisonPath& path) const;
    CompareResult compare_members(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const;

    static CompareResult fail(MismatchKind kind, node_ptr actual, node_ptr expected, ComparisonPath path);
};

} // namespace equiv
