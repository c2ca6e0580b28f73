// flow_internal.hpp - Shared state of one flow invocation
//
// Work (what remains to be laid out), Config (fixed for the whole flow),
// Stop (control-flow outcome of composition) and the skip set that records
// insertions already folded into some region.

#ifndef QUIRE_FLOW_INTERNAL_HPP
#define QUIRE_FLOW_INTERNAL_HPP

#include "flow_collect.hpp"
#include "flow_layout.hpp"
#include <memory>
#include <vector>

namespace quire {

// ============================================================================
// Stop
// ============================================================================

enum class StopKind : uint8_t {
    None,           // Continue
    Finish,         // The region ends here
    Relayout,       // Redo the region at `scope` with new insertions
    Error,          // Fatal; the diagnostic is already recorded
};

struct Stop {
    StopKind kind;
    bool forced;            // Finish: explicit break rather than lack of space
    PlacementScope scope;   // Relayout: which level to redo

    static Stop none() { return Stop{StopKind::None, false, PlacementScope::Column}; }
    static Stop finish(bool forced) { return Stop{StopKind::Finish, forced, PlacementScope::Column}; }
    static Stop relayout(PlacementScope scope) { return Stop{StopKind::Relayout, false, scope}; }
    static Stop error() { return Stop{StopKind::Error, false, PlacementScope::Column}; }

    bool ok() const { return kind == StopKind::None; }
};

// ============================================================================
// Skip Set
// ============================================================================

// Identities of floats and footnotes already incorporated into an insertion.
// Copies share storage; the first insertion into a shared set copies it, so a
// snapshot never observes later insertions.
class SkipSet {
public:
    SkipSet() {}

    bool contains(const FlowNode* key) const;
    void insert(const FlowNode* key);
    void extend(const std::vector<const FlowNode*>& keys);

    size_t size() const { return set_ ? set_->size() : 0; }

    // Whether both sets share the same storage
    bool shares_storage(const SkipSet& other) const {
        return set_ && set_ == other.set_;
    }

private:
    void make_unique();

    std::shared_ptr<std::vector<const FlowNode*>> set_;   // sorted
};

// ============================================================================
// Spill of a breakable block
// ============================================================================

// Remembers the regions a breakable block has consumed so far, so that the
// next slice can be produced by laying the block out again into the same
// region sequence extended by the current region.
struct MultiSpill {
    const MultiChild* multi;
    float full;                 // Full height of the first region
    float first;                // Remaining height of the first region
    std::vector<float> backlog; // Heights of regions consumed after the first
    int min_backlog_len;        // Backlog length of the original regions
};

// ============================================================================
// Work
// ============================================================================

struct Work {
    const Child* children;      // Remaining children (head first)
    int child_count;
    bool has_spill;
    MultiSpill spill;
    std::vector<const PlacedChild*> floats;     // Queued floats, in order
    std::vector<const FlowNode*> footnotes;     // Queued footnote markers, in order
    std::vector<FlowNode*> footnote_spill;      // Remaining frames of an entry
    std::vector<const FlowNode*> tags;          // Tags awaiting the next frame
    SkipSet skips;
    int line_number;            // Last assigned line number

    explicit Work(Children children);

    const Child* head() const { return child_count > 0 ? children : nullptr; }
    void advance() {
        if (child_count > 0) {
            children++;
            child_count--;
        }
    }

    // Nothing remains to be laid out
    bool done() const {
        return child_count == 0 && !has_spill && floats.empty() &&
               footnotes.empty() && footnote_spill.empty();
    }

    void extend_skips(const std::vector<const FlowNode*>& keys) { skips.extend(keys); }
};

// ============================================================================
// Config
// ============================================================================

struct ColumnConfig {
    int count;
    float width;
    float gutter;
    Dir dir;
};

struct FootnoteConfig {
    const FlowNode* separator;  // null = default rule
    float clearance;
    float gap;
    bool expand;
};

struct LineNumberConfig {
    LineNumberingScope scope;
    float clearance;            // Explicit clearance or the default clearance
    float digit_width;
};

struct Config {
    FlowMode mode;
    const FlowStyle* shared;
    ColumnConfig columns;
    FootnoteConfig footnote;
    bool has_line_numbers;      // Root flows only
    LineNumberConfig line_numbers;

    bool root() const { return mode == FlowMode::Root; }
};

// Derive the configuration of a flow from its style and regions
Config flow_config(const FlowStyle* shared, const Regions& regions, int columns,
                   Rel gutter, FlowMode mode);

} // namespace quire

#endif // QUIRE_FLOW_INTERNAL_HPP
