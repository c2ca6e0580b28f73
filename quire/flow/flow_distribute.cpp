// flow_distribute.cpp - Distribution of children into one column

#include "flow_distribute.hpp"
#include "flow_block.hpp"
#include "lib/log.h"
#include <algorithm>

namespace quire {

// ============================================================================
// Items
// ============================================================================

enum class ItemKind : uint8_t {
    Tag,            // Introspection tag
    Abs,            // Absolute spacing
    Fr,             // Fractional spacing or a fractional block
    Frame,          // Placed frame of a line or block
    Placed,         // Non-floating placed element
};

struct Item {
    ItemKind kind;
    uint8_t weakness;           // Abs / Fr spacing
    float amount;               // Abs: length, Fr: fraction
    const SingleChild* single;  // Fr: fractional block or null
    FlowNode* frame;            // Frame / Placed
    Align align;                // Frame
    const PlacedChild* placed;  // Placed
    const FlowNode* tag;        // Tag

    static Item make(ItemKind kind) {
        Item item;
        item.kind = kind;
        item.weakness = 0;
        item.amount = 0;
        item.single = nullptr;
        item.frame = nullptr;
        item.align = Align::Start;
        item.placed = nullptr;
        item.tag = nullptr;
        return item;
    }

    // Whether the item may be moved to the next region together with the
    // content that follows it
    bool migratable() const {
        switch (kind) {
            case ItemKind::Tag:
                return true;
            case ItemKind::Frame:
                return frame->width == 0 && frame->height == 0 && frame_is_invisible(frame);
            case ItemKind::Placed:
                return !placed->floating;
            default:
                return false;
        }
    }
};

// State that can be restored when a region ends on migratable or sticky content
struct Snapshot {
    Work work;
    size_t items;

    Snapshot(const Work& w, size_t n) : work(w), items(n) {}
};

// ============================================================================
// Distributor
// ============================================================================

struct Distributor {
    Composer& composer;
    Regions regions;
    std::vector<Item> items;
    Snapshot sticky;        // Restore point before a trailing sticky group
    bool has_sticky;
    int stickable;          // -1 undecided, 0 no, 1 yes

    Distributor(Composer& c, const Regions& r)
        : composer(c), regions(r), sticky(c.work, 0), has_sticky(false), stickable(-1) {}

    FlowContext& ctx() { return composer.ctx; }
    Work& work() { return composer.work; }

    Snapshot snapshot() const { return Snapshot(composer.work, items.size()); }

    void restore(const Snapshot& snapshot) {
        composer.work = snapshot.work;
        items.resize(snapshot.items);
    }

    Stop run();
    Stop child(const Child& child);
    void tag(const FlowNode* tag);
    void rel(Rel amount, uint8_t weakness);
    void fr(float fr, uint8_t weakness);
    bool keep_spacing(bool is_fr, float amount, uint8_t weakness);
    Stop line(const LineChild* line);
    Stop single(const SingleChild* single);
    Stop multi(const MultiChild* multi);
    Stop multi_spill();
    Stop placed(const PlacedChild* placed);
    Stop flush();
    Stop break_(bool weak);
    Stop frame(FlowNode* frame, Align align, bool sticky, bool breakable);
    void flush_tags();
    float weak_spacing() const;
    void trim_spacing();
    Stop finalize(Region region, const Snapshot& init, bool forced, FlowNode** out);
};

Stop Distributor::run() {
    // continue a breakable block first
    if (work().has_spill) {
        Stop stop = multi_spill();
        if (!stop.ok()) return stop;
    }

    while (const Child* c = work().head()) {
        Stop stop = child(*c);
        if (!stop.ok()) return stop;
        work().advance();
    }
    return Stop::none();
}

Stop Distributor::child(const Child& c) {
    switch (c.kind) {
        case ChildKind::Tag:
            tag(c.u.tag);
            return Stop::none();
        case ChildKind::Rel:
            rel(c.u.rel.amount, c.u.rel.weakness);
            return Stop::none();
        case ChildKind::Fr:
            fr(c.u.fr.fr, c.u.fr.weakness);
            return Stop::none();
        case ChildKind::Line:
            return line(c.u.line);
        case ChildKind::Single:
            return single(c.u.single);
        case ChildKind::Multi:
            return multi(c.u.multi);
        case ChildKind::Placed:
            return placed(c.u.placed);
        case ChildKind::Flush:
            return flush();
        case ChildKind::Break:
            return break_(c.u.weak);
    }
    return Stop::none();
}

// ============================================================================
// Tags and Spacing
// ============================================================================

void Distributor::tag(const FlowNode* tag) {
    work().tags.push_back(tag);
}

void Distributor::rel(Rel amount, uint8_t weakness) {
    float length = amount.relative_to(regions.base().y);
    if (weakness > 0 && !keep_spacing(false, length, weakness)) return;
    regions.size.y -= length;
    Item item = Item::make(ItemKind::Abs);
    item.amount = length;
    item.weakness = weakness;
    items.push_back(item);
}

void Distributor::fr(float fr, uint8_t weakness) {
    if (weakness > 0 && !keep_spacing(true, fr, weakness)) return;
    Item item = Item::make(ItemKind::Fr);
    item.amount = fr;
    item.weakness = weakness;
    items.push_back(item);
}

// Decide whether new weak spacing is kept. Weak spacing at the start of a
// region is dropped; adjacent weak spacing collapses into the stronger (lower
// weakness) or, at equal weakness, the larger one.
bool Distributor::keep_spacing(bool is_fr, float amount, uint8_t weakness) {
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        Item& prev = *it;
        switch (prev.kind) {
            case ItemKind::Abs: {
                if (prev.weakness == 0) break;
                bool replace = weakness < prev.weakness ||
                    (weakness == prev.weakness && !is_fr && amount > prev.amount);
                if (replace) {
                    regions.size.y += prev.amount;
                    if (!is_fr) regions.size.y -= amount;
                    prev.kind = is_fr ? ItemKind::Fr : ItemKind::Abs;
                    prev.amount = amount;
                    prev.weakness = weakness;
                }
                return false;
            }
            case ItemKind::Fr:
                // fractional spacing absorbs weak spacing next to it
                if (prev.single) return true;
                return false;
            case ItemKind::Tag:
            case ItemKind::Placed:
                break;
            case ItemKind::Frame:
                return true;
        }
    }
    return false;
}

// Remove trailing weak spacing
void Distributor::trim_spacing() {
    for (size_t i = items.size(); i-- > 0;) {
        Item& item = items[i];
        switch (item.kind) {
            case ItemKind::Abs:
                if (item.weakness > 0) {
                    regions.size.y += item.amount;
                    items.erase(items.begin() + i);
                    return;
                }
                break;
            case ItemKind::Fr:
                // fractional items end the trailing spacing
                if (!item.single && item.weakness > 0) items.erase(items.begin() + i);
                return;
            case ItemKind::Tag:
            case ItemKind::Placed:
                break;
            case ItemKind::Frame:
                return;
        }
    }
}

// Trailing weak spacing that a float may reclaim
float Distributor::weak_spacing() const {
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        switch (it->kind) {
            case ItemKind::Abs:
                if (it->weakness > 0) return it->amount;
                break;
            case ItemKind::Tag:
            case ItemKind::Placed:
                break;
            default:
                return 0;
        }
    }
    return 0;
}

// ============================================================================
// Content
// ============================================================================

Stop Distributor::line(const LineChild* line) {
    float height = line->line->node_class == NodeClass::Line ? line->line->height : 0;

    // a later region may improve things
    if (!fits(regions.size.y, height) && regions.may_progress()) {
        return Stop::finish(false);
    }

    // keep the orphan/widow group together if the next region can host it
    float next = 0;
    if (!fits(regions.size.y, line->need) && regions.nth_height(1, &next) &&
        fits(next, line->need)) {
        return Stop::finish(false);
    }

    if (!fits(regions.size.y, height)) {
        ctx().diagnostics.add_warning(line->line->source, "line does not fit into the region");
    }
    FlowNode* out = line_frame(ctx().arena, *line);
    return frame(out, line->align, false, false);
}

Stop Distributor::single(const SingleChild* single) {
    FlowNode* out = nullptr;
    Region region{regions.base(), regions.expand};
    if (!layout_single(ctx(), *single, region, &out)) return Stop::error();

    // fractional blocks are sized when the column is finalized
    if (single->fr > 0) {
        Stop stop = composer.footnotes(regions, out, 0, false, true);
        if (!stop.ok()) return stop;
        flush_tags();
        Item item = Item::make(ItemKind::Fr);
        item.amount = single->fr;
        item.single = single;
        items.push_back(item);
        return Stop::none();
    }

    if (!fits(regions.size.y, out->height)) {
        if (regions.may_progress()) return Stop::finish(false);
        ctx().diagnostics.add_warning(single->block->source,
            "block does not fit into the region and overflows");
    }
    return frame(out, single->align, single->sticky, false);
}

Stop Distributor::multi(const MultiChild* multi) {
    // lines and single blocks do this through their fits checks
    if (regions.is_full()) return Stop::finish(false);

    FlowNode* out = nullptr;
    MultiSpill spill;
    bool has_spill = false;
    bool spill_has_content = false;
    if (!multi_child_layout(ctx(), multi, regions, &out, &spill, &has_spill, &spill_has_content)) {
        return Stop::error();
    }

    // nothing of the block fits here: skip this region
    if (!frame_has_content(out) && has_spill && spill_has_content && regions.may_progress()) {
        return Stop::finish(false);
    }

    Stop stop = frame(out, multi->align, multi->sticky, true);
    if (!stop.ok()) return stop;

    if (has_spill) {
        work().spill = spill;
        work().has_spill = true;
        work().advance();
        return Stop::finish(false);
    }
    return Stop::none();
}

Stop Distributor::multi_spill() {
    if (regions.is_full()) return Stop::finish(false);

    MultiSpill spill = work().spill;
    work().has_spill = false;

    FlowNode* out = nullptr;
    bool has_more = false;
    if (!multi_spill_layout(ctx(), &spill, regions, &out, &has_more)) return Stop::error();

    Stop stop = frame(out, spill.multi->align, false, true);
    if (!stop.ok()) {
        // not consumed: keep the spill as it was
        work().has_spill = true;
        return stop;
    }

    if (has_more) {
        work().spill = spill;
        work().has_spill = true;
        return Stop::finish(false);
    }
    return Stop::none();
}

Stop Distributor::placed(const PlacedChild* placed) {
    if (placed->floating) {
        // the float may take the space of trailing weak spacing
        float weak = weak_spacing();
        regions.size.y += weak;
        bool has_frames = std::any_of(items.begin(), items.end(),
            [](const Item& item) { return item.kind == ItemKind::Frame; });
        Stop stop = composer.place_float(placed, regions, has_frames, true);
        regions.size.y -= weak;
        return stop;
    }

    FlowNode* out = nullptr;
    if (!layout_placed(ctx(), *placed, regions.base(), &out)) return Stop::error();
    Stop stop = composer.footnotes(regions, out, 0, true, true);
    if (!stop.ok()) return stop;
    flush_tags();
    Item item = Item::make(ItemKind::Placed);
    item.frame = out;
    item.placed = placed;
    items.push_back(item);
    return Stop::none();
}

Stop Distributor::flush() {
    if (!work().floats.empty()) return Stop::finish(false);
    return Stop::none();
}

Stop Distributor::break_(bool weak) {
    bool has_next = regions.backlog_len > 0 || regions.has_last;
    if ((!weak || !items.empty()) && has_next) {
        work().advance();
        return Stop::finish(true);
    }
    return Stop::none();
}

Stop Distributor::frame(FlowNode* frame, Align align, bool sticky_frame, bool breakable) {
    if (sticky_frame) {
        // the first block of a sticky group decides whether the group can
        // stick at all: only if other content precedes it in this region
        if (stickable < 0) {
            stickable = std::any_of(items.begin(), items.end(),
                [](const Item& item) { return !item.migratable(); }) ? 1 : 0;
        }
        if (!has_sticky && stickable == 1) {
            sticky = snapshot();
            has_sticky = true;
        }
    } else if (frame_has_content(frame)) {
        has_sticky = false;
        stickable = -1;
    }

    Stop stop = composer.footnotes(regions, frame, frame->height, breakable, true);
    if (!stop.ok()) return stop;

    regions.size.y -= frame->height;
    flush_tags();
    Item item = Item::make(ItemKind::Frame);
    item.frame = frame;
    item.align = align;
    items.push_back(item);
    return Stop::none();
}

void Distributor::flush_tags() {
    for (const FlowNode* tag : work().tags) {
        Item item = Item::make(ItemKind::Tag);
        item.tag = tag;
        items.push_back(item);
    }
    work().tags.clear();
}

// ============================================================================
// Finalization
// ============================================================================

static float fr_share(float fr, float total, float space) {
    if (total <= 0 || !is_finite(space)) return 0;
    return std::max(0.0f, fr / total * space);
}

static FlowNode* tag_item(Arena* arena, const FlowNode* tag) {
    FlowNode* n = alloc_node(arena, NodeClass::Tag);
    n->src = tag;
    n->source = tag->source;
    n->content.tag = tag->content.tag;
    return n;
}

Stop Distributor::finalize(Region region, const Snapshot& init, bool forced, FlowNode** out) {
    Arena* arena = ctx().arena;

    if (!forced) {
        bool all_migratable = !items.empty() &&
            std::all_of(items.begin(), items.end(),
                [](const Item& item) { return item.migratable(); });
        if (all_migratable && !work().done() && regions.may_progress()) {
            // only tags and the like: move them along with the next content
            restore(init);
        } else if (has_sticky) {
            // ended on a sticky group: move it to the next region
            restore(sticky);
        }
    }

    trim_spacing();

    float frs = 0;
    Size used = Size::zero();
    bool has_fr_child = false;
    for (const Item& item : items) {
        switch (item.kind) {
            case ItemKind::Abs:
                used.y += item.amount;
                break;
            case ItemKind::Fr:
                frs += item.amount;
                has_fr_child |= item.single != nullptr;
                break;
            case ItemKind::Frame:
                used.y += item.frame->height;
                used.x = std::max(used.x, item.frame->width);
                break;
            default:
                break;
        }
    }

    // fractional spacing occupies the remaining space
    float fr_space = 0;
    if (frs > 0 && is_finite(region.size.y)) {
        fr_space = region.size.y - used.y;
        used.y = region.size.y;
    }

    std::vector<FlowNode*> fr_frames;
    if (has_fr_child) {
        for (const Item& item : items) {
            if (item.kind != ItemKind::Fr || !item.single) continue;
            float length = fr_share(item.amount, frs, fr_space);
            Region pod{Size{region.size.x, length}, region.expand};
            FlowNode* frame = nullptr;
            if (!layout_single(ctx(), *item.single, pod, &frame)) return Stop::error();
            used.x = std::max(used.x, frame->width);
            fr_frames.push_back(frame);
        }
    }

    if (!region.expand.x) used.x = std::max(used.x, composer.insertion_width());

    Size size;
    size.x = region.expand.x ? region.size.x : std::min(used.x, region.size.x);
    size.y = region.expand.y ? region.size.y : std::min(used.y, region.size.y);
    if (!is_finite(size.x)) size.x = used.x;
    if (!is_finite(size.y)) size.y = used.y;

    FlowNode* output = make_frame(arena, size);
    float offset = 0;
    size_t fr_index = 0;

    for (const Item& item : items) {
        switch (item.kind) {
            case ItemKind::Tag:
                frame_push(arena, output, Point{0, offset}, tag_item(arena, item.tag));
                break;
            case ItemKind::Abs:
                offset += item.amount;
                break;
            case ItemKind::Fr: {
                float length = fr_share(item.amount, frs, fr_space);
                if (item.single) {
                    FlowNode* frame = fr_frames[fr_index++];
                    float x = align_position(item.single->align, size.x - frame->width);
                    frame_push(arena, output, Point{x, offset}, frame);
                }
                offset += length;
                break;
            }
            case ItemKind::Frame: {
                FlowNode* frame = item.frame;
                float x = align_position(item.align, size.x - frame->width);
                frame_push(arena, output, Point{x, offset}, frame);
                offset += frame->height;
                break;
            }
            case ItemKind::Placed: {
                FlowNode* frame = item.frame;
                const PlacedChild* placed = item.placed;
                float x = align_position(placed->align_x, size.x - frame->width);
                float y = offset;
                switch (placed->align_y) {
                    case PlaceY::Start:  y = 0; break;
                    case PlaceY::Center: y = (size.y - frame->height) / 2; break;
                    case PlaceY::End:    y = size.y - frame->height; break;
                    default: break;
                }
                frame_push(arena, output,
                    Point{x + placed->delta.x, y + placed->delta.y}, frame);
                break;
            }
        }
    }

    // pending tags at the end of the flow (or before a break) stay here
    if (forced || work().done()) {
        for (const FlowNode* tag : work().tags) {
            frame_push(arena, output, Point{0, offset}, tag_item(arena, tag));
        }
        work().tags.clear();
    }

    *out = output;
    return Stop::none();
}

// ============================================================================
// Entry Point
// ============================================================================

Stop distribute(Composer& composer, const Regions& regions, FlowNode** out) {
    Distributor distributor(composer, regions);
    Snapshot init = distributor.snapshot();

    Stop stop = distributor.run();
    bool forced;
    switch (stop.kind) {
        case StopKind::None:
            forced = composer.work.done();
            break;
        case StopKind::Finish:
            forced = stop.forced;
            break;
        default:
            return stop;
    }

    Region region{regions.size, regions.expand};
    return distributor.finalize(region, init, forced, out);
}

} // namespace quire
