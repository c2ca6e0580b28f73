// flow_layout.hpp - Flow Layout Entry Points
//
// Lays out a realized content sequence across a sequence of regions (pages
// or columns) and produces one frame per consumed region. Handles columns,
// breakable blocks, floats, footnotes and line numbers.
//
// Usage:
//   FlowContext* ctx = flow_context_create(pool);
//   FlowStyle style = FlowStyle::defaults();
//   Regions regions = Regions::repeat(Size{400, 600}, Expand{true, true});
//   FlowResult result = layout_flow(ctx, content, &style, regions, 1, Rel::zero(), FlowMode::Root);
//   if (!result.success) { ... inspect ctx->diagnostics ... }
//   flow_context_destroy(ctx);

#ifndef QUIRE_FLOW_LAYOUT_HPP
#define QUIRE_FLOW_LAYOUT_HPP

#include "flow_node.hpp"
#include "flow_style.hpp"
#include "flow_diag.hpp"
#include "lib/arena.h"
#include "lib/mempool.h"

namespace quire {

// Maximum nesting depth of flows within flows
constexpr int MAX_LAYOUT_DEPTH = 72;

enum class FlowMode : uint8_t {
    Root,           // Page-level flow: footnotes and line numbers are active
    Block,          // Nested flow of block-level content
    Inline,         // Nested flow made of lines only: no paragraph spacing
};

const char* flow_mode_name(FlowMode mode);

struct FlowCache;

// ============================================================================
// Context
// ============================================================================

struct FlowStats {
    int flows;              // Flow invocations that were computed
    int regions;            // Regions composed
    int relayouts;          // Column or page relayouts
    int cache_hits;
    int cache_misses;
};

struct FlowContext {
    Pool* pool;
    Arena* arena;               // Output frames and diagnostics
    Diagnostics diagnostics;
    FlowCache* cache;           // null = no memoization
    int depth;                  // Current flow nesting depth
    int max_depth;              // Deepest nesting reached by the flow being computed
    FlowStats stats;
};

// Create a context with its own output arena. Memoization is enabled unless
// `memoize` is false.
FlowContext* flow_context_create(Pool* pool, bool memoize = true);
void flow_context_destroy(FlowContext* ctx);

// ============================================================================
// Results
// ============================================================================

// Frames of one flow, in region order
struct Fragment {
    FlowNode** frames;
    int frame_count;
};

struct FlowResult {
    FlowNode** frames;          // null on failure
    int frame_count;
    bool success;
};

// ============================================================================
// Entry Points
// ============================================================================

// Lay out `content` with `columns` columns separated by `gutter` (relative to
// the region width) into `regions`.
FlowResult layout_flow(FlowContext* ctx, const FlowNode* content, const FlowStyle* shared,
                       Regions regions, int columns, Rel gutter, FlowMode mode);

// Lay out block-level (or inline-level) content into a region sequence
FlowResult layout_fragment(FlowContext* ctx, const FlowNode* content, const FlowStyle* shared,
                           Regions regions);

// Lay out content into exactly one region. Returns null on failure.
FlowNode* layout_frame(FlowContext* ctx, const FlowNode* content, const FlowStyle* shared,
                       Region region);

// Lay out the body of a Columns node into a region sequence
FlowResult layout_columns(FlowContext* ctx, const FlowNode* columns, const FlowStyle* shared,
                          Regions regions);

// ============================================================================
// Internal Entry Point
// ============================================================================

// Shared implementation of the entry points, used for nested flows as well.
// `origin` is the node that triggered the flow (diagnostics location).
// Returns false on a fatal error; the diagnostic is in ctx.diagnostics.
bool flow_layout_impl(FlowContext& ctx, const FlowNode* content, const FlowStyle* shared,
                      const Regions& regions, int columns, Rel gutter, FlowMode mode,
                      const FlowNode* origin, Fragment* out);

} // namespace quire

#endif // QUIRE_FLOW_LAYOUT_HPP
