// flow_collect.hpp - Classification of content into flow children
//
// A realized content sequence is turned once into a flat array of typed
// children. The array lives in a scratch arena owned by a single flow
// invocation and is never mutated afterwards; the distributor only moves an
// index through it.

#ifndef QUIRE_FLOW_COLLECT_HPP
#define QUIRE_FLOW_COLLECT_HPP

#include "flow_node.hpp"
#include "flow_style.hpp"
#include "flow_layout.hpp"

namespace quire {

// ============================================================================
// Children
// ============================================================================

enum class ChildKind : uint8_t {
    Tag,            // Introspection marker
    Rel,            // Relative / absolute spacing
    Fr,             // Fractional spacing
    Line,           // One paragraph line
    Single,         // Unbreakable block
    Multi,          // Breakable block
    Placed,         // Placed or floating element
    Flush,          // Emit queued floats first
    Break,          // Column/region break
};

const char* child_kind_name(ChildKind kind);

// A paragraph line, or a zero-size line carrying a lone footnote marker
struct LineChild {
    const FlowNode* line;       // Line node (or Footnote node for a lone marker)
    Align align;
    float need;                 // Height needed including the orphan/widow group
    bool numbered;
};

struct SingleChild {
    const FlowNode* block;
    const FlowStyle* style;
    Align align;
    bool sticky;
    float fr;                   // > 0: fractional height
};

struct MultiChild {
    const FlowNode* block;      // Block or Columns node
    const FlowStyle* style;
    Align align;
    bool sticky;
};

struct PlacedChild {
    const FlowNode* place;
    const FlowStyle* style;
    Align align_x;
    PlaceY align_y;
    PlacementScope scope;
    bool floating;
    float clearance;
    Point delta;
};

struct Child {
    ChildKind kind;
    union {
        const FlowNode* tag;
        struct {
            Rel amount;
            uint8_t weakness;
        } rel;
        struct {
            float fr;
            uint8_t weakness;
        } fr;
        const LineChild* line;
        const SingleChild* single;
        const MultiChild* multi;
        const PlacedChild* placed;
        bool weak;              // Break
    } u;
};

struct Children {
    const Child* items;
    int count;
};

// ============================================================================
// Collection
// ============================================================================

// Whether a sequence consists of inline-level content only (lines and tags)
bool is_inline_content(const FlowNode* content);

// Classify `content` (a Sequence, or a single element) into children.
// Children and their payloads are allocated in `scratch`. Returns false on
// a fatal error (invalid placement).
bool collect(FlowContext& ctx, Arena* scratch, const FlowNode* content,
             const FlowStyle* shared, FlowMode mode, Children* out);

} // namespace quire

#endif // QUIRE_FLOW_COLLECT_HPP
