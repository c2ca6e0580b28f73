// flow_compose.cpp - Composition of one region

#include "flow_compose.hpp"
#include "flow_block.hpp"
#include "flow_distribute.hpp"
#include "lib/log.h"
#include <algorithm>

namespace quire {

// ============================================================================
// Insertions
// ============================================================================

void Insertions::push_float(const PlacedChild* placed, FlowNode* frame, Align align_y) {
    width = std::max(width, frame->width);
    float amount = frame->height + placed->clearance;
    if (align_y == Align::Start) {
        top_size += amount;
        top_floats.push_back(PlacedFrame{placed, frame});
    } else {
        bottom_size += amount;
        bottom_floats.push_back(PlacedFrame{placed, frame});
    }
}

void Insertions::push_footnote(const Config& config, FlowNode* frame) {
    width = std::max(width, frame->width);
    bottom_size += config.footnote.gap + frame->height;
    footnotes.push_back(frame);
}

void Insertions::push_footnote_separator(const Config& config, FlowNode* frame) {
    width = std::max(width, frame->width);
    bottom_size += config.footnote.clearance + frame->height;
    footnote_separator = frame;
}

FlowNode* Insertions::finalize(Arena* arena, Work& work, const Config& config, FlowNode* inner) {
    work.extend_skips(skips);
    work.footnote_spill.insert(work.footnote_spill.end(), footnote_spill.begin(),
                               footnote_spill.end());
    // nested notes follow the entry that referenced them
    work.footnotes.insert(work.footnotes.begin(), footnote_queue.begin(), footnote_queue.end());

    if (top_floats.empty() && bottom_floats.empty() && !footnote_separator && footnotes.empty()) {
        return inner;
    }

    Size size{inner->width, inner->height + height()};
    FlowNode* output = make_frame(arena, size);
    float offset_top = 0;
    float offset_bottom = size.y - bottom_size;

    for (const PlacedFrame& pf : top_floats) {
        float x = align_position(pf.placed->align_x, size.x - pf.frame->width);
        float y = offset_top;
        offset_top += pf.frame->height + pf.placed->clearance;
        frame_push(arena, output, Point{x + pf.placed->delta.x, y + pf.placed->delta.y}, pf.frame);
    }

    frame_push(arena, output, Point{0, top_size}, inner);

    // floats go above the footnotes
    for (const PlacedFrame& pf : bottom_floats) {
        offset_bottom += pf.placed->clearance;
        float x = align_position(pf.placed->align_x, size.x - pf.frame->width);
        float y = offset_bottom;
        offset_bottom += pf.frame->height;
        frame_push(arena, output, Point{x + pf.placed->delta.x, y + pf.placed->delta.y}, pf.frame);
    }

    if (footnote_separator) {
        offset_bottom += config.footnote.clearance;
        frame_push(arena, output, Point{0, offset_bottom}, footnote_separator);
        offset_bottom += footnote_separator->height;
    }

    for (FlowNode* frame : footnotes) {
        offset_bottom += config.footnote.gap;
        frame_push(arena, output, Point{0, offset_bottom}, frame);
        offset_bottom += frame->height;
    }

    return output;
}

// ============================================================================
// Region and Columns
// ============================================================================

Stop Composer::page(const Regions& regions, FlowNode** out) {
    // parent-scoped floats restart the whole region
    Work checkpoint(work);
    FlowNode* inner = nullptr;

    for (;;) {
        Regions pod = regions;
        pod.size.y -= page_insertions.height();

        size_t known = page_insertions.skips.size();
        Stop stop = page_contents(pod, &inner);
        if (stop.ok()) break;

        if (stop.kind == StopKind::Relayout && stop.scope == PlacementScope::Parent) {
            if (page_insertions.skips.size() == known) {
                log_error("flow_compose: region relayout without a new insertion");
                ctx.diagnostics.add_error(SourceLoc{0, 0, 0, 0},
                    "region layout did not converge");
                return Stop::error();
            }
            ctx.stats.relayouts++;
            log_debug("flow_compose: region relayout with %d page insertions",
                      (int)page_insertions.skips.size());
            work = checkpoint;
            continue;
        }
        if (stop.kind != StopKind::Error) {
            log_error("flow_compose: unexpected stop at region level");
            ctx.diagnostics.add_error(SourceLoc{0, 0, 0, 0}, "unexpected stop in region layout");
            return Stop::error();
        }
        return stop;
    }

    *out = page_insertions.finalize(ctx.arena, work, config, inner);
    return Stop::none();
}

Stop Composer::page_contents(const Regions& regions, FlowNode** out) {
    int count = config.columns.count;
    if (count == 1) return column_layout(regions, out);

    // every region height repeats once per column
    float column_height = regions.size.y;
    std::vector<float> backlog;
    backlog.reserve((regions.backlog_len + 1) * count);
    for (int i = 0; i <= regions.backlog_len; i++) {
        float height = i == 0 ? column_height : regions.backlog[i - 1];
        for (int j = 0; j < count; j++) backlog.push_back(height);
    }
    backlog.erase(backlog.begin());

    Regions inner = regions;
    inner.size = Size{config.columns.width, column_height};
    inner.backlog = backlog.data();
    inner.backlog_len = (int)backlog.size();
    inner.expand = Expand{true, regions.expand.y};

    Size size{regions.size.x, regions.expand.y ? regions.size.y : 0};
    FlowNode* output = make_frame(ctx.arena, size, FrameKind::Hard);
    float offset = 0;

    for (int i = 0; i < count; i++) {
        column = i;
        FlowNode* frame = nullptr;
        Stop stop = column_layout(inner, &frame);
        if (!stop.ok()) return stop;

        if (!regions.expand.y) output->height = std::max(output->height, frame->height);
        float width = frame->width;
        float x = config.columns.dir == Dir::LTR ? offset : regions.size.x - offset - width;
        offset += width + config.columns.gutter;
        frame_push(ctx.arena, output, Point{x, 0}, frame);
        inner.next();
    }

    *out = output;
    return Stop::none();
}

Stop Composer::column_layout(const Regions& regions, FlowNode** out) {
    column_insertions = Insertions();

    if (!work.footnote_spill.empty()) {
        if (!footnote_spill(regions.base())) return Stop::error();
    }

    Work checkpoint(work);
    FlowNode* inner = nullptr;

    for (;;) {
        Regions pod = regions;
        pod.size.y -= column_insertions.height();

        size_t known = column_insertions.skips.size();
        Stop stop = column_contents(pod, &inner);
        if (stop.ok()) break;

        if (stop.kind == StopKind::Relayout && stop.scope == PlacementScope::Column) {
            if (column_insertions.skips.size() == known) {
                log_error("flow_compose: column relayout without a new insertion");
                ctx.diagnostics.add_error(SourceLoc{0, 0, 0, 0},
                    "column layout did not converge");
                return Stop::error();
            }
            ctx.stats.relayouts++;
            log_debug("flow_compose: column %d relayout with %d insertions", column,
                      (int)column_insertions.skips.size());
            work = checkpoint;
            continue;
        }
        return stop;
    }

    Insertions insertions;
    std::swap(insertions, column_insertions);
    FlowNode* output = insertions.finalize(ctx.arena, work, config, inner);

    if (config.has_line_numbers) {
        if (!layout_line_numbers(output)) return Stop::error();
    }

    *out = output;
    return Stop::none();
}

Stop Composer::column_contents(const Regions& regions, FlowNode** out) {
    // queued footnotes and floats come first, in order
    std::vector<const FlowNode*> notes;
    std::swap(notes, work.footnotes);
    for (const FlowNode* note : notes) {
        Regions pod = regions;
        Stop stop = footnote(note, &pod, 0, false, true, false);
        if (!stop.ok()) return stop;
    }

    std::vector<const PlacedChild*> floats;
    std::swap(floats, work.floats);
    for (const PlacedChild* placed : floats) {
        Stop stop = place_float(placed, regions, false, false);
        if (!stop.ok()) return stop;
    }

    return distribute(*this, regions, out);
}

float Composer::insertion_width() const {
    return std::max(page_insertions.width, column_insertions.width);
}

bool Composer::skipped(const FlowNode* key) const {
    if (work.skips.contains(key)) return true;
    auto& page = page_insertions.skips;
    auto& col = column_insertions.skips;
    return std::find(page.begin(), page.end(), key) != page.end() ||
           std::find(col.begin(), col.end(), key) != col.end();
}

bool Composer::queued_footnote(const FlowNode* note) const {
    auto& nested = column_insertions.footnote_queue;
    return std::find(work.footnotes.begin(), work.footnotes.end(), note) != work.footnotes.end() ||
           std::find(nested.begin(), nested.end(), note) != nested.end();
}

// Notes found inside an entry are not found again after a relayout, so they
// are kept with the column's insertions.
void Composer::queue_footnote(const FlowNode* note, bool nested) {
    if (queued_footnote(note)) return;
    if (nested) {
        column_insertions.footnote_queue.push_back(note);
    } else {
        work.footnotes.push_back(note);
    }
}

// ============================================================================
// Floats
// ============================================================================

Stop Composer::place_float(const PlacedChild* placed, const Regions& regions, bool clearance,
                           bool migratable) {
    const FlowNode* key = placed->place;
    if (skipped(key)) return Stop::none();

    // keep the order of queued floats
    if (!work.floats.empty()) {
        work.floats.push_back(placed);
        return Stop::none();
    }

    Size base = placed->scope == PlacementScope::Column ? regions.base() : page_base;
    FlowNode* frame = nullptr;
    if (!layout_placed(ctx, *placed, base, &frame)) return Stop::error();

    // exact for a column, an estimate across the remaining columns for the region
    float remaining = regions.size.y;
    if (placed->scope == PlacementScope::Parent) {
        int count = config.columns.count;
        float sum = 0;
        for (int i = 0; i < count - column; i++) {
            float height = 0;
            if (!regions.nth_height(i, &height)) break;
            sum += height;
        }
        remaining = sum / count;
    }

    float gap = clearance ? placed->clearance : 0;
    float need = frame->height + gap;

    if (!fits(remaining, need)) {
        if (regions.may_progress()) {
            log_debug("flow_compose: float of height %.1f queued", need);
            work.floats.push_back(placed);
            return Stop::none();
        }
        ctx.diagnostics.add_warning(key->source, "float does not fit into the region");
    }

    Stop stop = footnotes(regions, frame, need, false, migratable);
    if (!stop.ok()) return stop;

    Align align_y;
    switch (placed->align_y) {
        case PlaceY::Start:
            align_y = Align::Start;
            break;
        case PlaceY::End:
            align_y = Align::End;
            break;
        default: {
            // top when its in-flow midpoint lies in the upper half
            float used = base.y - remaining;
            float ratio = (used + need / 2) / base.y;
            align_y = ratio <= 0.5f ? Align::Start : Align::End;
            break;
        }
    }

    Insertions& area = placed->scope == PlacementScope::Column ? column_insertions
                                                              : page_insertions;
    area.push_float(placed, frame, align_y);
    area.skips.push_back(key);
    return Stop::relayout(placed->scope);
}

// ============================================================================
// Footnotes
// ============================================================================

void find_footnote_markers(const FlowNode* frame, float y_offset, std::vector<FoundMarker>& out) {
    traverse_positioned(frame, Point{0, y_offset}, [&](const FlowNode* n, Point pos) {
        if (n->node_class == NodeClass::FootnoteRef && n->content.fnref.note) {
            out.push_back(FoundMarker{pos.y, n->content.fnref.note});
        }
    });
}

Stop Composer::footnotes(const Regions& regions, const FlowNode* frame, float flow_need,
                         bool breakable, bool migratable) {
    if (!config.root()) return Stop::none();

    std::vector<FoundMarker> notes;
    find_footnote_markers(frame, 0, notes);
    if (notes.empty()) return Stop::none();

    bool relayout = false;
    Regions pod = regions;
    migratable = migratable && !breakable && pod.may_progress();

    for (const FoundMarker& found : notes) {
        // a breakable frame needs only the part above its marker
        float need = breakable ? found.y : flow_need;
        Stop stop = footnote(found.note, &pod, need, migratable, false, false);
        if (stop.kind == StopKind::Relayout) {
            relayout = true;
        } else if (!stop.ok()) {
            return stop;
        }
        // only the first entry decides whether the origin migrates
        migratable = false;
    }

    if (relayout) return Stop::relayout(PlacementScope::Column);
    return Stop::none();
}

// Whether a later region of the sequence offers more height than this one
static bool later_region_taller(const Regions& regions) {
    for (int i = 0; i < regions.backlog_len; i++) {
        if (regions.backlog[i] > regions.full + ABS_EPS) return true;
    }
    return regions.has_last && regions.last > regions.full + ABS_EPS;
}

Stop Composer::footnote(const FlowNode* note, Regions* regions, float flow_need, bool migratable,
                        bool queued, bool nested) {
    // references and already placed notes
    if (note->content.footnote.target || !note->content.footnote.entry) return Stop::none();
    if (skipped(note)) return Stop::none();

    Insertions& area = column_insertions;

    // keep the order of queued notes
    if (!work.footnote_spill.empty() || !work.footnotes.empty() ||
        !area.footnote_spill.empty() || !area.footnote_queue.empty()) {
        queue_footnote(note, nested);
        return Stop::none();
    }

    FlowNode* separator = nullptr;
    float separator_height = 0;
    if (area.footnotes.empty()) {
        if (!separator_frame(regions->base(), &separator)) return Stop::error();
        separator_height = config.footnote.clearance + separator->height;
    }

    Regions pod = *regions;
    pod.expand = Expand{config.footnote.expand, false};
    pod.size.y -= flow_need + separator_height + config.footnote.gap;

    Fragment fragment;
    if (!flow_layout_impl(ctx, note->content.footnote.entry, config.shared, pod, 1, Rel::zero(),
                          FlowMode::Block, note, &fragment)) {
        return Stop::error();
    }
    FlowNode* first = fragment.frames[0];

    if (!frame_has_content(first)) {
        bool forced = queued && area.footnotes.empty() && column_insertions.height() == 0 &&
                      page_insertions.height() == 0 && !later_region_taller(*regions);
        if (!forced) {
            if (migratable) return Stop::finish(false);
            log_debug("flow_compose: footnote entry queued for the next region");
            queue_footnote(note, nested);
            return Stop::none();
        }

        // no region will ever be larger: place it and let it overflow
        ctx.diagnostics.add_warning(note->source, "footnote entry does not fit into the region");
        Regions whole = Regions::one(Size{pod.size.x, UNBOUNDED}, pod.expand);
        if (!flow_layout_impl(ctx, note->content.footnote.entry, config.shared, whole, 1,
                              Rel::zero(), FlowMode::Block, note, &fragment)) {
            return Stop::error();
        }
        first = fragment.frames[0];
    }

    if (separator) {
        area.push_footnote_separator(config, separator);
        regions->size.y -= separator_height;
    }
    area.push_footnote(config, first);
    area.skips.push_back(note);
    regions->size.y -= config.footnote.gap + first->height;

    for (int i = 1; i < fragment.frame_count; i++) {
        area.footnote_spill.push_back(fragment.frames[i]);
    }

    // notes referenced from within the entry
    std::vector<FoundMarker> nested_markers;
    for (int i = 0; i < fragment.frame_count; i++) {
        find_footnote_markers(fragment.frames[i], 0, nested_markers);
    }
    for (const FoundMarker& found : nested_markers) {
        Stop stop = footnote(found.note, regions, flow_need, false, false, true);
        if (stop.kind == StopKind::Error) return stop;
    }

    return Stop::relayout(PlacementScope::Column);
}

bool Composer::footnote_spill(Size base) {
    std::vector<FlowNode*> frames;
    std::swap(frames, work.footnote_spill);

    FlowNode* separator = nullptr;
    if (!separator_frame(base, &separator)) return false;
    column_insertions.push_footnote_separator(config, separator);
    column_insertions.push_footnote(config, frames[0]);

    for (size_t i = 1; i < frames.size(); i++) work.footnote_spill.push_back(frames[i]);
    log_debug("flow_compose: footnote spill placed, %d frames remain",
              (int)work.footnote_spill.size());
    return true;
}

bool Composer::separator_frame(Size base, FlowNode** out) {
    const FlowNode* custom = config.footnote.separator;
    if (custom) {
        Regions pod = Regions::one(base, Expand{config.footnote.expand, false});
        Fragment fragment;
        if (!flow_layout_impl(ctx, custom, config.shared, pod, 1, Rel::zero(), FlowMode::Block,
                              custom, &fragment)) {
            return false;
        }
        *out = fragment.frames[0];
        return true;
    }

    // default: a thin rule over 30% of the width
    float length = 0.3f * base.x;
    float stroke = 0.5f;
    FlowNode* frame = make_frame(ctx.arena,
        Size{config.footnote.expand ? base.x : length, stroke});
    frame_push(ctx.arena, frame, Point{0, 0}, make_rule(ctx.arena, length, stroke));
    *out = frame;
    return true;
}

// ============================================================================
// Line Numbers
// ============================================================================

struct NumberedLine {
    float y;
    const FlowNode* line;
};

static int count_digits(int number) {
    int digits = 1;
    while (number >= 10) {
        number /= 10;
        digits++;
    }
    return digits;
}

bool Composer::layout_line_numbers(FlowNode* output) {
    if (column == 0 && config.line_numbers.scope == LineNumberingScope::Page) {
        work.line_number = 0;
    }

    std::vector<NumberedLine> lines;
    traverse_positioned(output, Point{0, 0}, [&](const FlowNode* n, Point pos) {
        if (n->node_class == NodeClass::Line && n->is_numbered()) {
            lines.push_back(NumberedLine{pos.y, n});
        }
    });
    if (lines.empty()) return true;

    std::stable_sort(lines.begin(), lines.end(),
        [](const NumberedLine& a, const NumberedLine& b) { return a.y < b.y; });

    struct Number {
        float y;
        FlowNode* item;
    };
    std::vector<Number> numbers;
    float max_width = 0;
    bool has_prev = false;
    float prev_bottom = 0;

    for (const NumberedLine& line : lines) {
        // lines too close together share one number
        if (has_prev && line.y < prev_bottom) continue;

        int number = ++work.line_number;
        float width = count_digits(number) * config.line_numbers.digit_width;
        float height = line.line->height;
        FlowNode* item = make_line_number(ctx.arena, number, width, height);
        item->src = line.line->src;

        has_prev = true;
        prev_bottom = line.y + std::max(height, 1.0f);
        max_width = std::max(max_width, width);
        numbers.push_back(Number{line.y, item});
    }

    // the last of several columns numbers at its end margin
    bool opposite = config.columns.count >= 2 && column + 1 == config.columns.count;
    Align margin = align_resolve(opposite ? Align::End : Align::Start, config.columns.dir);
    float clearance = config.line_numbers.clearance;

    for (const Number& n : numbers) {
        float x = margin == Align::Start ? -max_width - clearance : output->width + clearance;
        float shift = align_position(align_inv(margin), max_width - n.item->width);
        frame_push(ctx.arena, output, Point{x + shift, n.y}, n.item);
    }

    log_debug("flow_compose: %d line numbers in column %d", (int)numbers.size(), column);
    return true;
}

// ============================================================================
// Entry Point
// ============================================================================

Stop compose(FlowContext& ctx, Work& work, const Config& config, const Regions& regions,
             FlowNode** out) {
    Composer composer(ctx, work, config, regions.base());
    return composer.page(regions, out);
}

} // namespace quire
