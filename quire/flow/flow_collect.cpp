// flow_collect.cpp - Classification of content into flow children

#include "flow_collect.hpp"
#include "lib/log.h"
#include <vector>

namespace quire {

const char* child_kind_name(ChildKind kind) {
    switch (kind) {
        case ChildKind::Tag:    return "Tag";
        case ChildKind::Rel:    return "Rel";
        case ChildKind::Fr:     return "Fr";
        case ChildKind::Line:   return "Line";
        case ChildKind::Single: return "Single";
        case ChildKind::Multi:  return "Multi";
        case ChildKind::Placed: return "Placed";
        case ChildKind::Flush:  return "Flush";
        case ChildKind::Break:  return "Break";
    }
    return "Unknown";
}

// Spacing weaknesses. A lower weakness wins when weak spacing collapses.
static constexpr uint8_t WEAKNESS_BLOCK_CUSTOM = 3;
static constexpr uint8_t WEAKNESS_BLOCK_AUTO = 4;
static constexpr uint8_t WEAKNESS_LEADING = 5;

bool is_inline_content(const FlowNode* content) {
    if (!content) return false;
    if (content->node_class == NodeClass::Line) return true;
    if (content->node_class != NodeClass::Sequence) return false;

    bool has_line = false;
    for (const FlowNode* c = content->first_child; c; c = c->next_sibling) {
        switch (c->node_class) {
            case NodeClass::Line:
                has_line = true;
                break;
            case NodeClass::Tag:
            case NodeClass::Footnote:
                break;
            default:
                return false;
        }
    }
    return has_line;
}

// ============================================================================
// Collector
// ============================================================================

struct Collector {
    FlowContext& ctx;
    Arena* scratch;
    const FlowStyle* shared;
    FlowMode mode;
    std::vector<Child> output;
    int element_count;

    Collector(FlowContext& c, Arena* a, const FlowStyle* s, FlowMode m)
        : ctx(c), scratch(a), shared(s), mode(m), element_count(0) {}

    const FlowStyle* style_of(const FlowNode* node) const {
        return node->style ? node->style : shared;
    }

    template<typename T>
    T* boxed(const T& value) {
        T* p = (T*)arena_alloc(scratch, sizeof(T));
        new (p) T(value);
        return p;
    }

    void push_rel(Rel amount, uint8_t weakness) {
        Child c;
        c.kind = ChildKind::Rel;
        c.u.rel.amount = amount;
        c.u.rel.weakness = weakness;
        output.push_back(c);
    }

    void push_fr(float fr, uint8_t weakness) {
        Child c;
        c.kind = ChildKind::Fr;
        c.u.fr.fr = fr;
        c.u.fr.weakness = weakness;
        output.push_back(c);
    }

    bool run(const FlowNode* content);
    bool element(const FlowNode* node);
    void lines(const FlowNode* const* lines, int len, const FlowStyle* style, Align align, bool numbered);
    void par(const FlowNode* par);
    void block(const FlowNode* block);
    void rule(const FlowNode* rule);
    bool place(const FlowNode* place);
    void lone_footnote(const FlowNode* note);
};

bool Collector::run(const FlowNode* content) {
    if (!content) return true;

    if (content->node_class != NodeClass::Sequence) {
        return element(content);
    }

    // consecutive bare lines form an implicit paragraph
    std::vector<const FlowNode*> pending;
    for (const FlowNode* c = content->first_child; c; c = c->next_sibling) {
        if (c->node_class == NodeClass::Line) {
            pending.push_back(c);
            continue;
        }
        if (!pending.empty()) {
            const FlowStyle* style = style_of(pending[0]);
            bool spaced = mode != FlowMode::Inline;
            if (spaced) push_rel(Rel::absolute(style->par_spacing), WEAKNESS_BLOCK_AUTO);
            lines(pending.data(), (int)pending.size(), style,
                align_resolve(pending[0]->content.line.align, style->dir), false);
            if (spaced) push_rel(Rel::absolute(style->par_spacing), WEAKNESS_BLOCK_AUTO);
            pending.clear();
        }
        if (c->node_class == NodeClass::Sequence) {
            if (!run(c)) return false;
            continue;
        }
        if (!element(c)) return false;
    }
    if (!pending.empty()) {
        const FlowStyle* style = style_of(pending[0]);
        bool spaced = mode != FlowMode::Inline;
        if (spaced) push_rel(Rel::absolute(style->par_spacing), WEAKNESS_BLOCK_AUTO);
        lines(pending.data(), (int)pending.size(), style,
            align_resolve(pending[0]->content.line.align, style->dir), false);
        if (spaced) push_rel(Rel::absolute(style->par_spacing), WEAKNESS_BLOCK_AUTO);
    }
    return true;
}

bool Collector::element(const FlowNode* node) {
    Child c;
    switch (node->node_class) {
        case NodeClass::Tag:
            c.kind = ChildKind::Tag;
            c.u.tag = node;
            output.push_back(c);
            return true;

        case NodeClass::Spacing:
            if (node->content.spacing.fr > 0) {
                push_fr(node->content.spacing.fr, node->content.spacing.weakness);
            } else {
                push_rel(Rel{node->content.spacing.amount, node->content.spacing.ratio},
                    node->content.spacing.weakness);
            }
            return true;

        case NodeClass::ColBreak:
            c.kind = ChildKind::Break;
            c.u.weak = node->content.colbreak.weak;
            output.push_back(c);
            return true;

        case NodeClass::Flush:
            c.kind = ChildKind::Flush;
            output.push_back(c);
            return true;

        case NodeClass::Paragraph:
            par(node);
            return true;

        case NodeClass::Line: {
            const FlowStyle* style = style_of(node);
            lines(&node, 1, style, align_resolve(node->content.line.align, style->dir), false);
            return true;
        }

        case NodeClass::Block:
        case NodeClass::Columns:
            block(node);
            return true;

        case NodeClass::Rule:
            rule(node);
            return true;

        case NodeClass::Place:
            return place(node);

        case NodeClass::Footnote:
            lone_footnote(node);
            return true;

        case NodeClass::Sequence:
            return run(node);

        default:
            ctx.diagnostics.add_warning(node->source,
                arena_sprintf(ctx.arena, "%s node is not valid content and was ignored",
                    node_class_name(node->node_class)));
            return true;
    }
}

void Collector::lines(const FlowNode* const* lines, int len, const FlowStyle* style,
                      Align align, bool numbered) {
    float leading = style->leading;

    // Orphan/widow prevention groups the first two and the last two lines
    bool prevent_orphans = style->orphan_prevention && len >= 2 && lines[1]->height > 0;
    bool prevent_widows = style->widow_prevention && len >= 2 && lines[len - 2]->height > 0;
    bool prevent_all = len == 3 && prevent_orphans && prevent_widows;

    auto height_at = [&](int i) -> float {
        return (i >= 0 && i < len) ? lines[i]->height : 0.0f;
    };
    float front_1 = height_at(0);
    float front_2 = height_at(1);
    float back_2 = height_at(len >= 2 ? len - 2 : 0);
    float back_1 = height_at(len - 1);

    for (int i = 0; i < len; i++) {
        if (i > 0) push_rel(Rel::absolute(leading), WEAKNESS_LEADING);

        float need;
        if (prevent_all && i == 0) {
            need = front_1 + leading + front_2 + leading + back_1;
        } else if (prevent_orphans && i == 0) {
            need = front_1 + leading + front_2;
        } else if (prevent_widows && i >= 2 && i + 2 == len) {
            need = back_2 + leading + back_1;
        } else {
            need = lines[i]->height;
        }

        LineChild lc;
        lc.line = lines[i];
        lc.align = align;
        lc.need = need;
        lc.numbered = numbered;

        Child c;
        c.kind = ChildKind::Line;
        c.u.line = boxed(lc);
        output.push_back(c);
    }
}

void Collector::par(const FlowNode* par) {
    const FlowStyle* style = style_of(par);
    Align align = align_resolve(par->content.par.align, style->dir);

    std::vector<const FlowNode*> line_nodes;
    for (const FlowNode* c = par->first_child; c; c = c->next_sibling) {
        if (c->node_class == NodeClass::Line) line_nodes.push_back(c);
    }

    bool spaced = mode != FlowMode::Inline;
    if (spaced) push_rel(Rel::absolute(style->par_spacing), WEAKNESS_BLOCK_AUTO);
    if (!line_nodes.empty()) {
        lines(line_nodes.data(), (int)line_nodes.size(), style, align, par->is_numbered());
    }
    if (spaced) push_rel(Rel::absolute(style->par_spacing), WEAKNESS_BLOCK_AUTO);
}

void Collector::block(const FlowNode* block) {
    const FlowStyle* style = style_of(block);
    Align align = align_resolve(block->content.block.align, style->dir);
    bool alone = element_count == 1;
    bool sticky = block->is_sticky();
    float fr = block->content.block.fr;

    float above = block->content.block.above;
    float below = block->content.block.below;
    if (above < 0) {
        push_rel(Rel::absolute(style->spacing_above()), WEAKNESS_BLOCK_AUTO);
    } else {
        push_rel(Rel::absolute(above), WEAKNESS_BLOCK_CUSTOM);
    }

    Child c;
    if (!block->is_breakable() || fr > 0) {
        SingleChild single;
        single.block = block;
        single.style = style;
        single.align = align;
        single.sticky = sticky;
        single.fr = fr;
        c.kind = ChildKind::Single;
        c.u.single = boxed(single);
    } else {
        MultiChild multi;
        multi.block = block;
        multi.style = style;
        multi.align = align;
        multi.sticky = sticky && !alone;
        c.kind = ChildKind::Multi;
        c.u.multi = boxed(multi);
    }
    output.push_back(c);

    if (below < 0) {
        push_rel(Rel::absolute(style->spacing_below()), WEAKNESS_BLOCK_AUTO);
    } else {
        push_rel(Rel::absolute(below), WEAKNESS_BLOCK_CUSTOM);
    }
}

void Collector::rule(const FlowNode* rule) {
    const FlowStyle* style = style_of(rule);
    SingleChild single;
    single.block = rule;
    single.style = style;
    single.align = align_resolve(Align::Start, style->dir);
    single.sticky = false;
    single.fr = 0;

    Child c;
    c.kind = ChildKind::Single;
    c.u.single = boxed(single);
    output.push_back(c);
}

bool Collector::place(const FlowNode* place) {
    const FlowStyle* style = style_of(place);
    bool floating = place->content.place.floating;
    PlaceY align_y = place->content.place.align_y;
    PlacementScope scope = place->content.place.scope;

    if (floating && (align_y == PlaceY::Center || align_y == PlaceY::InFlow)) {
        ctx.diagnostics.add_error(place->source,
            "vertical floating placement must be auto, top, or bottom");
        return false;
    }
    if (!floating && align_y == PlaceY::Auto) {
        ctx.diagnostics.add_error(place->source,
            "automatic positioning is only available for floating placement",
            "enable floating placement on the element");
        return false;
    }
    if (!floating && scope == PlacementScope::Parent) {
        ctx.diagnostics.add_error(place->source,
            "parent-scoped positioning is currently only available for floating placement",
            "enable floating placement on the element");
        return false;
    }

    PlacedChild placed;
    placed.place = place;
    placed.style = style;
    placed.align_x = align_resolve(place->content.place.align_x, style->dir);
    placed.align_y = align_y;
    placed.scope = scope;
    placed.floating = floating;
    placed.clearance = place->content.place.clearance < 0
        ? style->float_clearance : place->content.place.clearance;
    placed.delta = Point{place->content.place.dx, place->content.place.dy};

    Child c;
    c.kind = ChildKind::Placed;
    c.u.placed = boxed(placed);
    output.push_back(c);
    return true;
}

void Collector::lone_footnote(const FlowNode* note) {
    LineChild lc;
    lc.line = note;
    lc.align = Align::Start;
    lc.need = 0;
    lc.numbered = false;

    Child c;
    c.kind = ChildKind::Line;
    c.u.line = boxed(lc);
    output.push_back(c);
}

// ============================================================================
// Public API
// ============================================================================

bool collect(FlowContext& ctx, Arena* scratch, const FlowNode* content,
             const FlowStyle* shared, FlowMode mode, Children* out) {
    Collector collector(ctx, scratch, shared, mode);
    if (content) {
        collector.element_count = content->node_class == NodeClass::Sequence
            ? content->child_count() : 1;
    }
    if (!collector.run(content)) {
        out->items = nullptr;
        out->count = 0;
        return false;
    }

    int count = (int)collector.output.size();
    Child* items = nullptr;
    if (count > 0) {
        items = (Child*)arena_alloc(scratch, count * sizeof(Child));
        for (int i = 0; i < count; i++) items[i] = collector.output[i];
    }
    out->items = items;
    out->count = count;
    log_debug("flow_collect: %d children (%s mode)", count, flow_mode_name(mode));
    return true;
}

} // namespace quire
