// flow_cache.cpp - Memoization of flow layout results

#include "flow_cache.hpp"
#include <cstring>
#include <functional>

namespace quire {

static void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

static size_t hash_float(float v) {
    // +0 and -0 compare equal
    if (v == 0) v = 0;
    uint32_t bits;
    memcpy(&bits, &v, sizeof(bits));
    return std::hash<uint32_t>()(bits);
}

// ============================================================================
// Structural Hashing
// ============================================================================

size_t flow_style_hash(const FlowStyle* style) {
    if (!style) return 0;
    size_t seed = (size_t)style->dir;
    hash_combine(seed, hash_float(style->font_size));
    hash_combine(seed, hash_float(style->leading));
    hash_combine(seed, hash_float(style->par_spacing));
    hash_combine(seed, (size_t)style->orphan_prevention | (size_t)style->widow_prevention << 1);
    hash_combine(seed, hash_float(style->block_above));
    hash_combine(seed, hash_float(style->block_below));
    hash_combine(seed, hash_float(style->float_clearance));
    hash_combine(seed, flow_content_hash(style->footnote_separator));
    hash_combine(seed, hash_float(style->footnote_clearance));
    hash_combine(seed, hash_float(style->footnote_gap));
    hash_combine(seed, (size_t)style->line_numbering_scope);
    hash_combine(seed, hash_float(style->line_number_clearance));
    hash_combine(seed, hash_float(style->line_number_digit_width));
    hash_combine(seed, hash_float(style->page_width));
    return seed;
}

bool flow_style_equal(const FlowStyle& a, const FlowStyle& b) {
    return a.dir == b.dir && a.font_size == b.font_size && a.leading == b.leading &&
           a.par_spacing == b.par_spacing && a.orphan_prevention == b.orphan_prevention &&
           a.widow_prevention == b.widow_prevention && a.block_above == b.block_above &&
           a.block_below == b.block_below && a.float_clearance == b.float_clearance &&
           a.footnote_separator == b.footnote_separator &&
           a.footnote_clearance == b.footnote_clearance && a.footnote_gap == b.footnote_gap &&
           a.line_numbering_scope == b.line_numbering_scope &&
           a.line_number_clearance == b.line_number_clearance &&
           a.line_number_digit_width == b.line_number_digit_width &&
           a.page_width == b.page_width;
}

static void hash_node_data(size_t& seed, const FlowNode* node) {
    const FlowNode::Content& c = node->content;
    switch (node->node_class) {
        case NodeClass::Tag:
            hash_combine(seed, c.tag.location);
            hash_combine(seed, (size_t)c.tag.kind);
            break;
        case NodeClass::Spacing:
            hash_combine(seed, hash_float(c.spacing.amount));
            hash_combine(seed, hash_float(c.spacing.ratio));
            hash_combine(seed, hash_float(c.spacing.fr));
            hash_combine(seed, c.spacing.weakness);
            break;
        case NodeClass::ColBreak:
            hash_combine(seed, c.colbreak.weak);
            break;
        case NodeClass::Paragraph:
            hash_combine(seed, (size_t)c.par.align);
            break;
        case NodeClass::Line:
            hash_combine(seed, (size_t)c.line.align);
            break;
        case NodeClass::Block:
        case NodeClass::Columns:
            hash_combine(seed, flow_content_hash(c.block.body));
            hash_combine(seed, hash_float(c.block.fr));
            hash_combine(seed, (size_t)c.block.align);
            hash_combine(seed, hash_float(c.block.above));
            hash_combine(seed, hash_float(c.block.below));
            hash_combine(seed, (size_t)c.block.count);
            hash_combine(seed, hash_float(c.block.gutter.abs));
            hash_combine(seed, hash_float(c.block.gutter.ratio));
            break;
        case NodeClass::Place:
            hash_combine(seed, flow_content_hash(c.place.body));
            hash_combine(seed, (size_t)c.place.align_x);
            hash_combine(seed, (size_t)c.place.align_y);
            hash_combine(seed, (size_t)c.place.scope);
            hash_combine(seed, c.place.floating);
            hash_combine(seed, hash_float(c.place.clearance));
            hash_combine(seed, hash_float(c.place.dx));
            hash_combine(seed, hash_float(c.place.dy));
            break;
        case NodeClass::Footnote:
            hash_combine(seed, flow_content_hash(c.footnote.entry));
            hash_combine(seed, std::hash<const void*>()(c.footnote.target));
            break;
        default:
            break;
    }
}

size_t flow_content_hash(const FlowNode* node) {
    if (!node) return 0;
    size_t seed = (size_t)node->node_class;
    hash_combine(seed, node->flags);
    hash_combine(seed, hash_float(node->width));
    hash_combine(seed, hash_float(node->height));
    hash_combine(seed, hash_float(node->x));
    hash_combine(seed, hash_float(node->y));
    hash_combine(seed, node->source.start);
    hash_combine(seed, node->source.end);
    hash_combine(seed, (size_t)node->source.line << 16 | node->source.column);
    hash_combine(seed, flow_style_hash(node->style));
    hash_node_data(seed, node);
    for (const FlowNode* c = node->first_child; c; c = c->next_sibling) {
        hash_combine(seed, flow_content_hash(c));
    }
    return seed;
}

// ============================================================================
// Cache
// ============================================================================

FlowCacheKey FlowCacheKey::make(const FlowNode* content, const FlowStyle* shared,
                                const Regions& regions, int columns, Rel gutter, FlowMode mode) {
    FlowCacheKey key;
    key.content = content;
    key.content_hash = flow_content_hash(content);
    key.shared = *shared;
    key.style_hash = flow_style_hash(shared);
    key.size = regions.size;
    key.full = regions.full;
    key.backlog.assign(regions.backlog, regions.backlog + regions.backlog_len);
    key.last = regions.has_last ? regions.last : 0;
    key.has_last = regions.has_last;
    key.expand = regions.expand;
    key.columns = columns;
    key.gutter = gutter;
    key.mode = mode;
    return key;
}

bool FlowCacheKey::operator==(const FlowCacheKey& o) const {
    return content == o.content && content_hash == o.content_hash &&
           style_hash == o.style_hash && flow_style_equal(shared, o.shared) &&
           size.x == o.size.x && size.y == o.size.y && full == o.full &&
           backlog == o.backlog && last == o.last && has_last == o.has_last &&
           expand.x == o.expand.x && expand.y == o.expand.y &&
           columns == o.columns && gutter.abs == o.gutter.abs &&
           gutter.ratio == o.gutter.ratio && mode == o.mode;
}

size_t FlowCacheKey::hash() const {
    size_t seed = std::hash<const void*>()(content);
    hash_combine(seed, content_hash);
    hash_combine(seed, style_hash);
    hash_combine(seed, hash_float(size.x));
    hash_combine(seed, hash_float(size.y));
    hash_combine(seed, hash_float(full));
    for (float h : backlog) hash_combine(seed, hash_float(h));
    hash_combine(seed, hash_float(last));
    hash_combine(seed, (size_t)has_last | (size_t)expand.x << 1 | (size_t)expand.y << 2);
    hash_combine(seed, (size_t)columns);
    hash_combine(seed, hash_float(gutter.abs));
    hash_combine(seed, hash_float(gutter.ratio));
    hash_combine(seed, (size_t)mode);
    return seed;
}

const FlowCacheEntry* FlowCache::find(const FlowCacheKey& key) const {
    auto it = buckets_.find(key.hash());
    if (it == buckets_.end()) return nullptr;
    for (const FlowCacheEntry& entry : it->second) {
        if (entry.key == key) return &entry;
    }
    return nullptr;
}

void FlowCache::insert(FlowCacheKey key, Fragment fragment, std::vector<Diagnostic> warnings,
                       int levels) {
    size_t h = key.hash();
    std::vector<FlowCacheEntry>& bucket = buckets_[h];
    for (FlowCacheEntry& entry : bucket) {
        if (entry.key == key) {
            entry.fragment = fragment;
            entry.warnings = std::move(warnings);
            entry.levels = levels;
            return;
        }
    }
    bucket.push_back(FlowCacheEntry{std::move(key), fragment, std::move(warnings), levels});
    count_++;
}

void FlowCache::clear() {
    buckets_.clear();
    count_ = 0;
}

} // namespace quire
