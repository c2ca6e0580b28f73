// flow_block.cpp - Layout of blocks, lines and placed elements

#include "flow_block.hpp"
#include "lib/log.h"
#include <algorithm>

namespace quire {

// ============================================================================
// Helpers
// ============================================================================

static FlowNode* make_marker(Arena* arena, const FlowNode* note) {
    FlowNode* n = alloc_node(arena, NodeClass::FootnoteRef);
    n->src = note;
    n->source = note->source;
    n->content.fnref.note = note;
    return n;
}

// Copy the footnote markers of a leaf block that fall into the slice
// [offset, offset + height) into `frame`.
static void push_block_markers(Arena* arena, FlowNode* frame, const FlowNode* block,
                               float offset, float height, bool last) {
    for (const FlowNode* c = block->first_child; c; c = c->next_sibling) {
        if (c->node_class != NodeClass::Footnote) continue;
        float y = c->y - offset;
        bool inside = y >= -ABS_EPS && (last ? y <= height + ABS_EPS : y < height - ABS_EPS);
        if (!inside) continue;
        FlowNode* marker = make_marker(arena, c);
        frame_push(arena, frame, Point{c->x, std::max(0.0f, y)}, marker);
    }
}

static float resolve_width(const FlowNode* node, float available) {
    if (node->width >= 0) return node->width;
    return is_finite(available) ? available : 0;
}

bool frame_has_content(const FlowNode* frame) {
    if (!frame) return false;
    switch (frame->node_class) {
        case NodeClass::Tag:
            return false;
        case NodeClass::Frame:
            if (frame->src && frame->first_child == nullptr && frame->height > ABS_EPS) return true;
            for (const FlowNode* c = frame->first_child; c; c = c->next_sibling) {
                if (frame_has_content(c)) return true;
            }
            return false;
        default:
            return true;
    }
}

// ============================================================================
// Lines
// ============================================================================

FlowNode* line_frame(Arena* arena, const LineChild& line) {
    const FlowNode* src = line.line;
    FlowNode* out = alloc_node(arena, NodeClass::Line);
    out->src = src;
    out->source = src->source;
    out->content.line.align = line.align;
    if (line.numbered) out->flags |= FlowNode::FLAG_NUMBERED;

    if (src->node_class == NodeClass::Footnote) {
        // lone marker: zero-size line
        frame_push(arena, out, Point{0, 0}, make_marker(arena, src));
        return out;
    }

    out->width = src->width;
    out->height = src->height;
    for (const FlowNode* c = src->first_child; c; c = c->next_sibling) {
        if (c->node_class == NodeClass::Footnote) {
            frame_push(arena, out, Point{c->x, c->y}, make_marker(arena, c));
        }
    }
    return out;
}

// ============================================================================
// Single Blocks
// ============================================================================

static FlowNode* rule_frame(Arena* arena, const FlowNode* rule, float width) {
    FlowNode* frame = make_frame(arena, Size{width, rule->height});
    frame->src = rule;
    frame->source = rule->source;
    FlowNode* item = make_rule(arena, width, rule->height);
    item->src = rule;
    frame_push(arena, frame, Point{0, 0}, item);
    return frame;
}

bool layout_single(FlowContext& ctx, const SingleChild& single, Region region, FlowNode** out) {
    const FlowNode* block = single.block;
    float width = resolve_width(block, region.size.x);

    if (block->node_class == NodeClass::Rule) {
        *out = rule_frame(ctx.arena, block, width);
        return true;
    }

    // fractional blocks take the whole region they are given
    bool fixed_height = block->height >= 0 || single.fr > 0;
    float height = 0;
    if (single.fr > 0) {
        height = is_finite(region.size.y) ? region.size.y : 0;
    } else if (block->height >= 0) {
        height = block->height;
    }

    FlowNode* frame = make_frame(ctx.arena, Size{width, height});
    frame->src = block;
    frame->source = block->source;

    const FlowNode* body = block->content.block.body;
    if (body) {
        float pod_height = fixed_height ? height : region.size.y;
        Regions pod = Regions::one(Size{width, pod_height}, Expand{true, fixed_height});
        Fragment fragment;
        if (!flow_layout_impl(ctx, body, single.style, pod, 1, Rel::zero(), FlowMode::Block,
                              block, &fragment)) {
            return false;
        }
        if (fragment.frame_count > 0) {
            FlowNode* inner = fragment.frames[0];
            if (!fixed_height) frame->height = inner->height;
            frame_push(ctx.arena, frame, Point{0, 0}, inner);
        }
    }

    push_block_markers(ctx.arena, frame, block, 0, frame->height, true);
    *out = frame;
    return true;
}

// ============================================================================
// Breakable Blocks
// ============================================================================

// Slice a leaf block of fixed height along the region heights
static void slice_leaf_block(FlowContext& ctx, const FlowNode* block, float width,
                             const Regions& regions, std::vector<FlowNode*>& frames) {
    float total = block->height >= 0 ? block->height : 0;
    float remaining = total;
    float offset = 0;

    for (int i = 0;; i++) {
        float available = 0;
        bool has_region = regions.nth_height(i, &available);
        bool repeating = i > regions.backlog_len;

        float slice;
        if (!has_region || !is_finite(available) || (repeating && available <= ABS_EPS)) {
            slice = remaining;
        } else {
            slice = std::min(remaining, std::max(0.0f, available));
        }
        bool last = remaining - slice <= ABS_EPS;

        FlowNode* frame = make_frame(ctx.arena, Size{width, slice});
        frame->src = block;
        frame->source = block->source;
        frame->content.frame.offset = offset;
        push_block_markers(ctx.arena, frame, block, offset, slice, last);
        frames.push_back(frame);

        offset += slice;
        remaining -= slice;
        if (last) break;
    }
}

bool layout_multi_block(FlowContext& ctx, const MultiChild& multi, const Regions& regions,
                        Fragment* out) {
    const FlowNode* block = multi.block;
    float width = resolve_width(block, regions.size.x);
    std::vector<FlowNode*> frames;

    const FlowNode* body = block->content.block.body;
    if (!body) {
        slice_leaf_block(ctx, block, width, regions, frames);
    } else {
        Regions pod = regions;
        pod.size.x = width;
        pod.expand = Expand{true, false};

        int columns = 1;
        Rel gutter = Rel::zero();
        if (block->node_class == NodeClass::Columns) {
            columns = block->content.block.count;
            gutter = block->content.block.gutter;
        }

        Fragment inner;
        if (!flow_layout_impl(ctx, body, multi.style, pod, columns, gutter, FlowMode::Block,
                              block, &inner)) {
            return false;
        }

        float offset = 0;
        for (int i = 0; i < inner.frame_count; i++) {
            FlowNode* piece = inner.frames[i];
            FlowNode* frame = make_frame(ctx.arena, Size{width, piece->height});
            frame->src = block;
            frame->source = block->source;
            frame->content.frame.offset = offset;
            frame_push(ctx.arena, frame, Point{0, 0}, piece);
            push_block_markers(ctx.arena, frame, block, offset, piece->height,
                               i + 1 == inner.frame_count);
            frames.push_back(frame);
            offset += piece->height;
        }
    }

    if (frames.empty()) {
        ctx.diagnostics.add_error(block->source, "breakable block produced no frames");
        return false;
    }

    out->frame_count = (int)frames.size();
    out->frames = (FlowNode**)arena_alloc(ctx.arena, frames.size() * sizeof(FlowNode*));
    for (size_t i = 0; i < frames.size(); i++) out->frames[i] = frames[i];
    return true;
}

bool multi_child_layout(FlowContext& ctx, const MultiChild* multi, const Regions& regions,
                        FlowNode** frame, MultiSpill* spill, bool* has_spill,
                        bool* spill_has_content) {
    Fragment fragment;
    if (!layout_multi_block(ctx, *multi, regions, &fragment)) return false;

    *frame = fragment.frames[0];
    *has_spill = fragment.frame_count > 1;
    *spill_has_content = false;
    if (*has_spill) {
        spill->multi = multi;
        spill->full = regions.full;
        spill->first = regions.size.y;
        spill->backlog.clear();
        spill->min_backlog_len = regions.backlog_len;
        for (int i = 1; i < fragment.frame_count; i++) {
            if (frame_has_content(fragment.frames[i])) {
                *spill_has_content = true;
                break;
            }
        }
    }
    return true;
}

bool multi_spill_layout(FlowContext& ctx, MultiSpill* spill, const Regions& regions,
                        FlowNode** frame, bool* has_more) {
    // the current region is committed to the consumed backlog
    spill->backlog.push_back(regions.size.y);

    std::vector<float> backlog(spill->backlog);
    for (int i = 0; i < regions.backlog_len; i++) backlog.push_back(regions.backlog[i]);

    // trailing heights equal to the repeating region are implied by it
    while ((int)backlog.size() > spill->min_backlog_len && regions.has_last &&
           approx_eq(backlog.back(), regions.last)) {
        backlog.pop_back();
    }

    Regions pod;
    pod.size = Size{regions.size.x, spill->first};
    pod.full = spill->full;
    pod.backlog = backlog.data();
    pod.backlog_len = (int)backlog.size();
    pod.last = regions.last;
    pod.has_last = regions.has_last;
    pod.expand = regions.expand;

    Fragment fragment;
    if (!layout_multi_block(ctx, *spill->multi, pod, &fragment)) return false;

    int index = (int)spill->backlog.size();
    if (index >= fragment.frame_count) {
        ctx.diagnostics.add_error(spill->multi->block->source,
            "breakable block produced too few frames");
        return false;
    }
    *frame = fragment.frames[index];
    *has_more = index + 1 < fragment.frame_count;
    return true;
}

// ============================================================================
// Placed Elements
// ============================================================================

bool layout_placed(FlowContext& ctx, const PlacedChild& placed, Size base, FlowNode** out) {
    const FlowNode* body = placed.place->content.place.body;
    Regions pod = Regions::one(base, Expand{false, false});

    if (!body) {
        *out = make_frame(ctx.arena, Size::zero());
        (*out)->src = placed.place;
        return true;
    }

    Fragment fragment;
    if (!flow_layout_impl(ctx, body, placed.style, pod, 1, Rel::zero(), FlowMode::Block,
                          placed.place, &fragment)) {
        return false;
    }
    FlowNode* inner = fragment.frames[0];
    FlowNode* frame = make_frame(ctx.arena, inner->size());
    frame->src = placed.place;
    frame->source = placed.place->source;
    frame_push(ctx.arena, frame, Point{0, 0}, inner);
    *out = frame;
    return true;
}

} // namespace quire
