// flow_internal.cpp - Work, Config and skip set

#include "flow_internal.hpp"
#include <algorithm>

namespace quire {

// ============================================================================
// SkipSet
// ============================================================================

bool SkipSet::contains(const FlowNode* key) const {
    if (!set_) return false;
    return std::binary_search(set_->begin(), set_->end(), key);
}

void SkipSet::make_unique() {
    if (!set_) {
        set_ = std::make_shared<std::vector<const FlowNode*>>();
    } else if (set_.use_count() > 1) {
        set_ = std::make_shared<std::vector<const FlowNode*>>(*set_);
    }
}

void SkipSet::insert(const FlowNode* key) {
    if (contains(key)) return;
    make_unique();
    auto pos = std::lower_bound(set_->begin(), set_->end(), key);
    set_->insert(pos, key);
}

void SkipSet::extend(const std::vector<const FlowNode*>& keys) {
    bool any_new = false;
    for (const FlowNode* key : keys) {
        if (!contains(key)) {
            any_new = true;
            break;
        }
    }
    if (!any_new) return;
    for (const FlowNode* key : keys) insert(key);
}

// ============================================================================
// Work
// ============================================================================

Work::Work(Children c)
    : children(c.items), child_count(c.count), has_spill(false), line_number(0) {
    spill.multi = nullptr;
    spill.full = 0;
    spill.first = 0;
    spill.min_backlog_len = 0;
}

// ============================================================================
// Config
// ============================================================================

Config flow_config(const FlowStyle* shared, const Regions& regions, int columns,
                   Rel gutter, FlowMode mode) {
    Config config;
    config.mode = mode;
    config.shared = shared;

    // an unbounded width cannot be divided into columns
    int count = is_finite(regions.size.x) ? (columns < 1 ? 1 : columns) : 1;
    float base_x = regions.base().x;
    float resolved_gutter = count > 1 ? gutter.relative_to(base_x) : 0;
    config.columns.count = count;
    config.columns.gutter = resolved_gutter;
    config.columns.width = (regions.size.x - resolved_gutter * (count - 1)) / count;
    config.columns.dir = shared->dir;

    config.footnote.separator = shared->footnote_separator;
    config.footnote.clearance = shared->footnote_clearance;
    config.footnote.gap = shared->footnote_gap;
    config.footnote.expand = regions.expand.x;

    config.has_line_numbers = mode == FlowMode::Root;
    config.line_numbers.scope = shared->line_numbering_scope;
    config.line_numbers.digit_width = shared->line_number_digit_width;
    if (shared->line_number_clearance >= 0) {
        config.line_numbers.clearance = shared->line_number_clearance;
    } else {
        float page_width = shared->page_width;
        if (!is_finite(page_width) || page_width <= 0) page_width = base_x;
        float em = shared->font_size > 0 ? shared->font_size : 0;
        float clearance = 0.026f * page_width;
        config.line_numbers.clearance = std::min(std::max(clearance, 0.75f * em), 2.5f * em);
    }
    return config;
}

} // namespace quire
