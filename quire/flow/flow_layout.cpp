// flow_layout.cpp - Flow Layout Entry Points and the Region Loop

#include "flow_layout.hpp"
#include "flow_cache.hpp"
#include "flow_collect.hpp"
#include "flow_compose.hpp"
#include "flow_internal.hpp"
#include "lib/log.h"
#include <algorithm>
#include <vector>

namespace quire {

const char* flow_mode_name(FlowMode mode) {
    switch (mode) {
        case FlowMode::Root:   return "root";
        case FlowMode::Block:  return "block";
        case FlowMode::Inline: return "inline";
    }
    return "unknown";
}

// ============================================================================
// Context
// ============================================================================

FlowContext* flow_context_create(Pool* pool, bool memoize) {
    if (!pool) {
        log_error("flow_layout: cannot create context without a pool");
        return nullptr;
    }
    FlowContext* ctx = (FlowContext*)pool_calloc(pool, sizeof(FlowContext));
    if (!ctx) {
        log_error("flow_layout: out of memory creating context");
        return nullptr;
    }
    ctx->pool = pool;
    ctx->arena = arena_create_default(pool);
    if (!ctx->arena) {
        log_error("flow_layout: failed to create output arena");
        pool_free(pool, ctx);
        return nullptr;
    }
    ctx->diagnostics.init(ctx->arena);
    ctx->cache = memoize ? new FlowCache() : nullptr;
    ctx->depth = 0;
    ctx->max_depth = 0;
    log_debug("flow_layout: context created (memoize=%d)", memoize ? 1 : 0);
    return ctx;
}

void flow_context_destroy(FlowContext* ctx) {
    if (!ctx) return;
    log_debug("flow_layout: context destroyed after %d flows, %d regions, %d relayouts, "
              "%d cache hits", ctx->stats.flows, ctx->stats.regions, ctx->stats.relayouts,
              ctx->stats.cache_hits);
    delete ctx->cache;
    arena_destroy(ctx->arena);
    pool_free(ctx->pool, ctx);
}

// ============================================================================
// Region Loop
// ============================================================================

// Lay out the classified children region by region until the work is done
static bool run_regions(FlowContext& ctx, const Children& children, const FlowStyle* shared,
                        const Regions& regions, int columns, Rel gutter, FlowMode mode,
                        std::vector<FlowNode*>& frames) {
    Config config = flow_config(shared, regions, columns, gutter, mode);
    Work work(children);
    Regions current = regions;

    for (;;) {
        FlowNode* frame = nullptr;
        Stop stop = compose(ctx, work, config, current, &frame);
        if (!stop.ok()) {
            if (stop.kind != StopKind::Error) {
                log_error("flow_layout: composition ended with an unexpected stop");
                ctx.diagnostics.add_error(SourceLoc{0, 0, 0, 0}, "unexpected stop in flow layout");
            }
            return false;
        }
        ctx.stats.regions++;
        frames.push_back(frame);

        // expanding regions are all filled, even when there is nothing left
        if (work.done() && (!current.expand.y || current.backlog_len == 0)) break;
        current.next();
    }
    return true;
}

static const FlowStyle* default_style() {
    static const FlowStyle style = FlowStyle::defaults();
    return &style;
}

bool flow_layout_impl(FlowContext& ctx, const FlowNode* content, const FlowStyle* shared,
                      const Regions& regions, int columns, Rel gutter, FlowMode mode,
                      const FlowNode* origin, Fragment* out) {
    out->frames = nullptr;
    out->frame_count = 0;
    SourceLoc loc = origin ? origin->source : (content ? content->source : SourceLoc{0, 0, 0, 0});
    if (!shared) shared = default_style();

    if (regions.expand.x && !is_finite(regions.size.x)) {
        ctx.diagnostics.add_error(loc, "cannot expand into infinite width");
        return false;
    }
    if (regions.expand.y && !is_finite(regions.size.y)) {
        ctx.diagnostics.add_error(loc, "cannot expand into infinite height");
        return false;
    }
    if (ctx.depth >= MAX_LAYOUT_DEPTH) {
        ctx.diagnostics.add_error(loc, "maximum layout depth exceeded",
            "try to reduce the amount of nesting in your layout");
        return false;
    }

    if (mode != FlowMode::Root && is_inline_content(content)) mode = FlowMode::Inline;

    FlowCacheKey key;
    if (ctx.cache) {
        key = FlowCacheKey::make(content, shared, regions, columns, gutter, mode);
        const FlowCacheEntry* entry = ctx.cache->find(key);
        // a hit must not hide nesting that exceeds the limit from here
        if (entry && ctx.depth + entry->levels <= MAX_LAYOUT_DEPTH) {
            ctx.stats.cache_hits++;
            ctx.max_depth = std::max(ctx.max_depth, ctx.depth + entry->levels);
            for (const Diagnostic& d : entry->warnings) ctx.diagnostics.replay(d);
            *out = entry->fragment;
            return true;
        }
        ctx.stats.cache_misses++;
    }

    Arena* scratch = arena_create_default(ctx.pool);
    if (!scratch) {
        log_error("flow_layout: failed to create scratch arena");
        ctx.diagnostics.add_error(loc, "out of memory");
        return false;
    }

    int first_diagnostic = ctx.diagnostics.count;
    std::vector<FlowNode*> frames;
    int outer_max_depth = ctx.max_depth;
    ctx.depth++;
    ctx.max_depth = ctx.depth;
    ctx.stats.flows++;

    Children children;
    bool ok = collect(ctx, scratch, content, shared, mode, &children) &&
              run_regions(ctx, children, shared, regions, columns, gutter, mode, frames);

    ctx.depth--;
    int levels = ctx.max_depth - ctx.depth;
    ctx.max_depth = std::max(outer_max_depth, ctx.max_depth);
    arena_destroy(scratch);

    if (!ok) {
        log_debug("flow_layout: %s flow failed at depth %d", flow_mode_name(mode), ctx.depth);
        return false;
    }

    out->frame_count = (int)frames.size();
    out->frames = (FlowNode**)arena_alloc(ctx.arena, frames.size() * sizeof(FlowNode*));
    for (size_t i = 0; i < frames.size(); i++) out->frames[i] = frames[i];
    log_debug("flow_layout: %s flow produced %d frames at depth %d", flow_mode_name(mode),
              out->frame_count, ctx.depth);

    if (ctx.cache) {
        std::vector<Diagnostic> warnings;
        for (int i = first_diagnostic; i < ctx.diagnostics.count; i++) {
            if (ctx.diagnostics.items[i].severity == Severity::Warning) {
                warnings.push_back(ctx.diagnostics.items[i]);
            }
        }
        ctx.cache->insert(std::move(key), *out, std::move(warnings), levels);
    }
    return true;
}

// ============================================================================
// Public Entry Points
// ============================================================================

static FlowResult to_result(bool ok, const Fragment& fragment) {
    FlowResult result;
    result.success = ok;
    result.frames = ok ? fragment.frames : nullptr;
    result.frame_count = ok ? fragment.frame_count : 0;
    return result;
}

FlowResult layout_flow(FlowContext* ctx, const FlowNode* content, const FlowStyle* shared,
                       Regions regions, int columns, Rel gutter, FlowMode mode) {
    if (!ctx) {
        log_error("flow_layout: layout_flow called without a context");
        return FlowResult{nullptr, 0, false};
    }
    Fragment fragment;
    bool ok = flow_layout_impl(*ctx, content, shared, regions, columns, gutter, mode, nullptr,
                               &fragment);
    return to_result(ok, fragment);
}

FlowResult layout_fragment(FlowContext* ctx, const FlowNode* content, const FlowStyle* shared,
                           Regions regions) {
    return layout_flow(ctx, content, shared, regions, 1, Rel::zero(), FlowMode::Block);
}

FlowNode* layout_frame(FlowContext* ctx, const FlowNode* content, const FlowStyle* shared,
                       Region region) {
    FlowResult result = layout_fragment(ctx, content, shared, Regions::one(region.size, region.expand));
    if (!result.success || result.frame_count == 0) return nullptr;
    return result.frames[0];
}

FlowResult layout_columns(FlowContext* ctx, const FlowNode* columns, const FlowStyle* shared,
                          Regions regions) {
    if (!ctx || !columns || columns->node_class != NodeClass::Columns) {
        log_error("flow_layout: layout_columns expects a columns node");
        return FlowResult{nullptr, 0, false};
    }
    Fragment fragment;
    bool ok = flow_layout_impl(*ctx, columns->content.block.body, shared, regions,
                               columns->content.block.count, columns->content.block.gutter,
                               FlowMode::Block, columns, &fragment);
    return to_result(ok, fragment);
}

} // namespace quire
