// flow_node.cpp - Flow node implementation

#include "flow_node.hpp"
#include "lib/log.h"

namespace quire {

// ============================================================================
// Node Class Names
// ============================================================================

const char* node_class_name(NodeClass nc) {
    switch (nc) {
        case NodeClass::Sequence:    return "Sequence";
        case NodeClass::Tag:         return "Tag";
        case NodeClass::Spacing:     return "Spacing";
        case NodeClass::ColBreak:    return "ColBreak";
        case NodeClass::Paragraph:   return "Paragraph";
        case NodeClass::Line:        return "Line";
        case NodeClass::Block:       return "Block";
        case NodeClass::Columns:     return "Columns";
        case NodeClass::Place:       return "Place";
        case NodeClass::Flush:       return "Flush";
        case NodeClass::Footnote:    return "Footnote";
        case NodeClass::Rule:        return "Rule";
        case NodeClass::Frame:       return "Frame";
        case NodeClass::FootnoteRef: return "FootnoteRef";
        case NodeClass::LineNumber:  return "LineNumber";
        case NodeClass::Error:       return "Error";
    }
    return "Unknown";
}

// ============================================================================
// Child Management
// ============================================================================

void FlowNode::append_child(FlowNode* child) {
    if (!child) return;

    child->parent = this;
    child->next_sibling = nullptr;
    child->prev_sibling = last_child;

    if (last_child) {
        last_child->next_sibling = child;
    } else {
        first_child = child;
    }
    last_child = child;
}

void FlowNode::remove_child(FlowNode* child) {
    if (!child || child->parent != this) return;

    if (child->prev_sibling) {
        child->prev_sibling->next_sibling = child->next_sibling;
    } else {
        first_child = child->next_sibling;
    }
    if (child->next_sibling) {
        child->next_sibling->prev_sibling = child->prev_sibling;
    } else {
        last_child = child->prev_sibling;
    }
    child->parent = nullptr;
    child->next_sibling = nullptr;
    child->prev_sibling = nullptr;
}

int FlowNode::child_count() const {
    int count = 0;
    for (FlowNode* c = first_child; c; c = c->next_sibling) count++;
    return count;
}

// ============================================================================
// Frame Operations
// ============================================================================

FlowNode* clone_frame(Arena* arena, const FlowNode* frame) {
    if (!frame) return nullptr;
    FlowNode* copy = (FlowNode*)arena_alloc(arena, sizeof(FlowNode));
    memcpy((void*)copy, (const void*)frame, sizeof(FlowNode));
    copy->parent = nullptr;
    copy->first_child = nullptr;
    copy->last_child = nullptr;
    copy->next_sibling = nullptr;
    copy->prev_sibling = nullptr;
    for (const FlowNode* c = frame->first_child; c; c = c->next_sibling) {
        copy->append_child(clone_frame(arena, c));
    }
    return copy;
}

FlowNode* frame_push(Arena* arena, FlowNode* frame, Point pos, FlowNode* item) {
    if (!item) return nullptr;
    if (item->parent) {
        item = clone_frame(arena, item);
    }
    item->x = pos.x;
    item->y = pos.y;
    frame->append_child(item);
    return item;
}

void frame_translate(FlowNode* frame, Point delta) {
    for (FlowNode* c = frame->first_child; c; c = c->next_sibling) {
        c->x += delta.x;
        c->y += delta.y;
    }
}

bool frame_is_invisible(const FlowNode* frame) {
    for (const FlowNode* c = frame->first_child; c; c = c->next_sibling) {
        if (c->node_class != NodeClass::Tag) return false;
    }
    return true;
}

bool frames_equal(const FlowNode* a, const FlowNode* b) {
    if (a == b) return true;
    if (!a || !b) return false;
    if (a->node_class != b->node_class) return false;
    if (a->src != b->src) return false;
    if (!approx_eq(a->x, b->x) || !approx_eq(a->y, b->y)) return false;
    if (!approx_eq(a->width, b->width) || !approx_eq(a->height, b->height)) return false;

    switch (a->node_class) {
        case NodeClass::Frame:
            if (a->content.frame.kind != b->content.frame.kind) return false;
            if (!approx_eq(a->content.frame.offset, b->content.frame.offset)) return false;
            break;
        case NodeClass::LineNumber:
            if (a->content.line_number.number != b->content.line_number.number) return false;
            break;
        case NodeClass::FootnoteRef:
            if (a->content.fnref.note != b->content.fnref.note) return false;
            break;
        default:
            break;
    }

    const FlowNode* ca = a->first_child;
    const FlowNode* cb = b->first_child;
    while (ca && cb) {
        if (!frames_equal(ca, cb)) return false;
        ca = ca->next_sibling;
        cb = cb->next_sibling;
    }
    return ca == nullptr && cb == nullptr;
}

void dump_frame(const FlowNode* frame, int indent) {
    if (!frame) return;
    switch (frame->node_class) {
        case NodeClass::Frame:
            log_debug("%*s%s %s at (%.2f, %.2f) size %.2fx%.2f offset %.2f", indent * 2, "",
                node_class_name(frame->node_class),
                frame->content.frame.kind == FrameKind::Hard ? "hard" : "soft",
                frame->x, frame->y, frame->width, frame->height, frame->content.frame.offset);
            break;
        case NodeClass::LineNumber:
            log_debug("%*s%s %d at (%.2f, %.2f)", indent * 2, "",
                node_class_name(frame->node_class), frame->content.line_number.number,
                frame->x, frame->y);
            break;
        default:
            log_debug("%*s%s at (%.2f, %.2f) size %.2fx%.2f", indent * 2, "",
                node_class_name(frame->node_class),
                frame->x, frame->y, frame->width, frame->height);
            break;
    }
    for (const FlowNode* c = frame->first_child; c; c = c->next_sibling) {
        dump_frame(c, indent + 1);
    }
}

} // namespace quire
