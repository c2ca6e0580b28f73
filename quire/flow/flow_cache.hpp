// flow_cache.hpp - Memoization of flow layout results
//
// A flow is a pure function of its content, shared style, regions, columns,
// gutter and mode. Successful results are stored together with the warnings
// their computation produced, so a hit can replay them into the sink.
// Content is identified by address and by a structural hash of its tree, so
// content edited in place misses. The shared style is compared by value.

#ifndef QUIRE_FLOW_CACHE_HPP
#define QUIRE_FLOW_CACHE_HPP

#include "flow_layout.hpp"
#include <unordered_map>
#include <vector>

namespace quire {

// Hash of a content tree: geometry, flags, node data, source locations and
// the styles the nodes refer to
size_t flow_content_hash(const FlowNode* node);

size_t flow_style_hash(const FlowStyle* style);
bool flow_style_equal(const FlowStyle& a, const FlowStyle& b);

struct FlowCacheKey {
    const FlowNode* content;
    size_t content_hash;
    FlowStyle shared;
    size_t style_hash;
    Size size;
    float full;
    std::vector<float> backlog;
    float last;
    bool has_last;
    Expand expand;
    int columns;
    Rel gutter;
    FlowMode mode;

    static FlowCacheKey make(const FlowNode* content, const FlowStyle* shared,
                             const Regions& regions, int columns, Rel gutter, FlowMode mode);

    bool operator==(const FlowCacheKey& other) const;
    size_t hash() const;
};

struct FlowCacheEntry {
    FlowCacheKey key;
    Fragment fragment;
    std::vector<Diagnostic> warnings;
    int levels;             // Nesting levels the computation used, itself included
};

struct FlowCache {
    // Look up a result. Returns null when absent.
    const FlowCacheEntry* find(const FlowCacheKey& key) const;

    void insert(FlowCacheKey key, Fragment fragment, std::vector<Diagnostic> warnings,
                int levels);

    size_t size() const { return count_; }
    void clear();

private:
    std::unordered_map<size_t, std::vector<FlowCacheEntry>> buckets_;
    size_t count_ = 0;
};

} // namespace quire

#endif // QUIRE_FLOW_CACHE_HPP
