// flow_node.hpp - Unified Flow Node System
//
// One node structure serves both as realized input content (paragraphs,
// blocks, placed elements, footnote markers, spacing) and as the output frame
// tree produced by flow layout.
//
// Design principles:
// - Single node type with discriminated union for content
// - Dimensions in points, positions relative to the parent node
// - Arena-allocated, no ownership semantics
// - Input nodes are never mutated by layout; output nodes reference their
//   source through `src`
//
// A size component below zero on an input node means "automatic".

#ifndef QUIRE_FLOW_NODE_HPP
#define QUIRE_FLOW_NODE_HPP

#include "flow_geom.hpp"
#include "lib/arena.h"
#include <cstdint>
#include <cstring>
#include <new>

namespace quire {

struct FlowStyle;

// ============================================================================
// Node Classification
// ============================================================================

enum class NodeClass : uint8_t {
    // ========================================
    // Content nodes (input)
    // ========================================
    Sequence,       // Ordered content; children are the elements
    Tag,            // Introspection marker, no geometry
    Spacing,        // Vertical spacing (absolute, relative or fractional)
    ColBreak,       // Column/region break
    Paragraph,      // Pre-broken paragraph; children are Line nodes
    Line,           // One line of a paragraph (also used in output)
    Block,          // Block-level box, possibly with a body
    Columns,        // Multi-column block
    Place,          // Placed / floating element
    Flush,          // Emit all pending floats before continuing
    Footnote,       // Footnote marker with its entry
    Rule,           // Filled rectangle (also used in output)

    // ========================================
    // Frame nodes (output)
    // ========================================
    Frame,          // Positioned container
    FootnoteRef,    // Rendered footnote marker inside a frame
    LineNumber,     // Line number in the margin

    // ========================================
    // Error handling
    // ========================================
    Error,
};

// String name for debugging
const char* node_class_name(NodeClass nc);

enum class TagKind : uint8_t {
    Start,
    End,
};

enum class PlacementScope : uint8_t {
    Column,         // Float within the current column
    Parent,         // Float spanning all columns of the region
};

// Vertical alignment of a placed element
enum class PlaceY : uint8_t {
    Auto,           // Floats only: top or bottom, whichever is closer
    InFlow,         // Non-floats only: at the current flow position
    Start,
    Center,
    End,
};

enum class FrameKind : uint8_t {
    Soft,
    Hard,           // Region frames and merged column frames
};

// ============================================================================
// Source Location (for error reporting)
// ============================================================================

struct SourceLoc {
    uint32_t start;         // Byte offset
    uint32_t end;           // Byte offset
    uint16_t line;          // Line number (1-based)
    uint16_t column;        // Column (1-based)
};

// ============================================================================
// FlowNode - The unified node structure
// ============================================================================

struct FlowNode {
    // ========================================
    // Type and flags
    // ========================================
    NodeClass node_class;
    uint8_t flags;

    // Flag bits
    static constexpr uint8_t FLAG_BREAKABLE = 0x01; // Block may split across regions
    static constexpr uint8_t FLAG_STICKY = 0x02;    // Block keeps with the following content
    static constexpr uint8_t FLAG_NUMBERED = 0x04;  // Lines receive line numbers

    // ========================================
    // Dimensions (points)
    // ========================================
    float width;
    float height;

    // ========================================
    // Position relative to parent (points, y grows downward)
    // ========================================
    float x;
    float y;

    // ========================================
    // Tree structure
    // ========================================
    FlowNode* parent;
    FlowNode* first_child;
    FlowNode* last_child;
    FlowNode* next_sibling;
    FlowNode* prev_sibling;

    // ========================================
    // Source mapping
    // ========================================
    SourceLoc source;
    const FlowStyle* style;     // Resolved style of an input node or null (shared style)
    const FlowNode* src;        // Output nodes: the input node they were produced from

    // ========================================
    // Content data (discriminated by node_class)
    // ========================================
    union Content {
        // Tag node
        struct {
            uint32_t location;
            TagKind kind;
        } tag;

        // Spacing node
        struct {
            float amount;           // Absolute part
            float ratio;            // Relative to the region's base height
            float fr;               // Fractional amount, > 0 overrides amount/ratio
            uint8_t weakness;       // 0 = strong
        } spacing;

        // ColBreak node
        struct {
            bool weak;
        } colbreak;

        // Paragraph node
        struct {
            Align align;
        } par;

        // Line node
        struct {
            Align align;
        } line;

        // Block / Columns node
        struct {
            FlowNode* body;         // Nested content or null (leaf block)
            float fr;               // Fractional height, > 0 overrides height
            Align align;
            float above;            // Spacing above, < 0 = style default
            float below;            // Spacing below, < 0 = style default
            int count;              // Columns: column count
            Rel gutter;             // Columns: gutter relative to the base width
        } block;

        // Place node
        struct {
            FlowNode* body;
            Align align_x;
            PlaceY align_y;
            PlacementScope scope;
            bool floating;
            float clearance;        // < 0 = style default
            float dx;
            float dy;
        } place;

        // Footnote node
        struct {
            FlowNode* entry;        // Entry content
            const FlowNode* target; // Non-null: reference to another footnote
        } footnote;

        // Frame node
        struct {
            FrameKind kind;
            float offset;           // Block slices: offset into the source block
        } frame;

        // FootnoteRef node
        struct {
            const FlowNode* note;
        } fnref;

        // LineNumber node
        struct {
            int number;
        } line_number;

        Content() { memset(this, 0, sizeof(Content)); }
    } content;

    // ========================================
    // Constructor
    // ========================================
    FlowNode(NodeClass nc = NodeClass::Error)
        : node_class(nc), flags(0),
          width(0), height(0), x(0), y(0),
          parent(nullptr), first_child(nullptr), last_child(nullptr),
          next_sibling(nullptr), prev_sibling(nullptr),
          source{0, 0, 0, 0}, style(nullptr), src(nullptr) {
        memset(&content, 0, sizeof(content));
    }

    bool is_breakable() const { return (flags & FLAG_BREAKABLE) != 0; }
    bool is_sticky() const { return (flags & FLAG_STICKY) != 0; }
    bool is_numbered() const { return (flags & FLAG_NUMBERED) != 0; }

    Size size() const { return Size{width, height}; }

    // ========================================
    // Child management
    // ========================================
    void append_child(FlowNode* child);
    void remove_child(FlowNode* child);
    int child_count() const;
};

// ============================================================================
// Node Factory Functions (arena allocation)
// ============================================================================

inline FlowNode* alloc_node(Arena* arena, NodeClass nc) {
    FlowNode* node = (FlowNode*)arena_alloc(arena, sizeof(FlowNode));
    new (node) FlowNode(nc);
    return node;
}

// ----------------------------------------
// Content nodes
// ----------------------------------------

inline FlowNode* make_sequence(Arena* arena) {
    return alloc_node(arena, NodeClass::Sequence);
}

inline FlowNode* make_tag(Arena* arena, uint32_t location, TagKind kind = TagKind::Start) {
    FlowNode* n = alloc_node(arena, NodeClass::Tag);
    n->content.tag.location = location;
    n->content.tag.kind = kind;
    return n;
}

inline FlowNode* make_spacing(Arena* arena, float amount, uint8_t weakness = 0) {
    FlowNode* n = alloc_node(arena, NodeClass::Spacing);
    n->content.spacing.amount = amount;
    n->content.spacing.weakness = weakness;
    return n;
}

inline FlowNode* make_rel_spacing(Arena* arena, Rel amount, uint8_t weakness = 0) {
    FlowNode* n = alloc_node(arena, NodeClass::Spacing);
    n->content.spacing.amount = amount.abs;
    n->content.spacing.ratio = amount.ratio;
    n->content.spacing.weakness = weakness;
    return n;
}

inline FlowNode* make_fr_spacing(Arena* arena, float fr, uint8_t weakness = 0) {
    FlowNode* n = alloc_node(arena, NodeClass::Spacing);
    n->content.spacing.fr = fr;
    n->content.spacing.weakness = weakness;
    return n;
}

inline FlowNode* make_colbreak(Arena* arena, bool weak = false) {
    FlowNode* n = alloc_node(arena, NodeClass::ColBreak);
    n->content.colbreak.weak = weak;
    return n;
}

inline FlowNode* make_paragraph(Arena* arena, Align align = Align::Start, bool numbered = false) {
    FlowNode* n = alloc_node(arena, NodeClass::Paragraph);
    n->content.par.align = align;
    if (numbered) n->flags |= FlowNode::FLAG_NUMBERED;
    return n;
}

inline FlowNode* make_line(Arena* arena, float width, float height) {
    FlowNode* n = alloc_node(arena, NodeClass::Line);
    n->width = width;
    n->height = height;
    n->content.line.align = Align::Start;
    return n;
}

// Leaf or body block. Pass width/height < 0 for automatic sizing.
inline FlowNode* make_block(Arena* arena, float width, float height, bool breakable = false,
                            FlowNode* body = nullptr) {
    FlowNode* n = alloc_node(arena, NodeClass::Block);
    n->width = width;
    n->height = height;
    n->content.block.body = body;
    n->content.block.align = Align::Start;
    n->content.block.above = -1;
    n->content.block.below = -1;
    if (breakable) n->flags |= FlowNode::FLAG_BREAKABLE;
    return n;
}

inline FlowNode* make_columns(Arena* arena, int count, Rel gutter, FlowNode* body) {
    FlowNode* n = alloc_node(arena, NodeClass::Columns);
    n->width = -1;
    n->height = -1;
    n->flags |= FlowNode::FLAG_BREAKABLE;
    n->content.block.body = body;
    n->content.block.count = count;
    n->content.block.gutter = gutter;
    n->content.block.align = Align::Start;
    n->content.block.above = -1;
    n->content.block.below = -1;
    return n;
}

inline FlowNode* make_place(Arena* arena, FlowNode* body, bool floating,
                            PlaceY align_y = PlaceY::Auto,
                            PlacementScope scope = PlacementScope::Column) {
    FlowNode* n = alloc_node(arena, NodeClass::Place);
    n->content.place.body = body;
    n->content.place.align_x = Align::Center;
    n->content.place.align_y = align_y;
    n->content.place.scope = scope;
    n->content.place.floating = floating;
    n->content.place.clearance = -1;
    return n;
}

inline FlowNode* make_flush(Arena* arena) {
    return alloc_node(arena, NodeClass::Flush);
}

inline FlowNode* make_footnote(Arena* arena, FlowNode* entry) {
    FlowNode* n = alloc_node(arena, NodeClass::Footnote);
    n->content.footnote.entry = entry;
    return n;
}

inline FlowNode* make_footnote_ref(Arena* arena, const FlowNode* target) {
    FlowNode* n = alloc_node(arena, NodeClass::Footnote);
    n->content.footnote.target = target;
    return n;
}

inline FlowNode* make_rule(Arena* arena, float w, float h) {
    FlowNode* n = alloc_node(arena, NodeClass::Rule);
    n->width = w;
    n->height = h;
    return n;
}

// ----------------------------------------
// Frame nodes
// ----------------------------------------

inline FlowNode* make_frame(Arena* arena, Size size, FrameKind kind = FrameKind::Soft) {
    FlowNode* n = alloc_node(arena, NodeClass::Frame);
    n->width = size.x;
    n->height = size.y;
    n->content.frame.kind = kind;
    return n;
}

inline FlowNode* make_line_number(Arena* arena, int number, float w, float h) {
    FlowNode* n = alloc_node(arena, NodeClass::LineNumber);
    n->content.line_number.number = number;
    n->width = w;
    n->height = h;
    return n;
}

// ============================================================================
// Frame Operations
// ============================================================================

// Deep copy of a frame subtree. Input nodes referenced through `src` and
// content pointers are shared, not copied.
FlowNode* clone_frame(Arena* arena, const FlowNode* frame);

// Place `item` into `frame` at `pos`. An item that is already part of another
// frame (e.g. a memoized result reused elsewhere) is cloned first.
FlowNode* frame_push(Arena* arena, FlowNode* frame, Point pos, FlowNode* item);

// Translate all items of a frame
void frame_translate(FlowNode* frame, Point delta);

// Whether a frame has no items at all
inline bool frame_is_empty(const FlowNode* frame) {
    return frame->first_child == nullptr;
}

// Whether a frame carries only introspection items and no visible content
bool frame_is_invisible(const FlowNode* frame);

// Structural comparison of two frame trees (geometry, classes, sources)
bool frames_equal(const FlowNode* a, const FlowNode* b);

// Print a frame tree to the debug log
void dump_frame(const FlowNode* frame, int indent = 0);

// ============================================================================
// Tree Traversal Helpers
// ============================================================================

// Visit all nodes in pre-order
template<typename F>
void traverse_preorder(const FlowNode* node, F&& visitor) {
    if (!node) return;
    visitor(node);
    for (const FlowNode* child = node->first_child; child; child = child->next_sibling) {
        traverse_preorder(child, visitor);
    }
}

// Visit all nodes with their position relative to the root of the traversal
template<typename F>
void traverse_positioned(const FlowNode* node, Point origin, F&& visitor) {
    for (const FlowNode* child = node->first_child; child; child = child->next_sibling) {
        Point pos = {origin.x + child->x, origin.y + child->y};
        visitor(child, pos);
        traverse_positioned(child, pos, visitor);
    }
}

} // namespace quire

#endif // QUIRE_FLOW_NODE_HPP
