// flow_compose.hpp - Composition of one region
//
// The composer produces exactly one frame per region. It lays out columns,
// integrates floats and footnotes into reserved insertion areas at the top
// and bottom of a column (or of the whole region for parent-scoped floats),
// and redoes a column or the region when a new insertion changes the space
// available to content that was already placed.
//
// Every relayout folds in at least one new insertion, so the number of
// relayouts per region is bounded by the number of insertions.

#ifndef QUIRE_FLOW_COMPOSE_HPP
#define QUIRE_FLOW_COMPOSE_HPP

#include "flow_internal.hpp"
#include <vector>

namespace quire {

// ============================================================================
// Insertions
// ============================================================================

struct PlacedFrame {
    const PlacedChild* placed;
    FlowNode* frame;
};

// Floats and footnotes reserved in one column (or one region)
struct Insertions {
    std::vector<PlacedFrame> top_floats;
    std::vector<PlacedFrame> bottom_floats;
    std::vector<FlowNode*> footnotes;
    FlowNode* footnote_separator;
    float top_size;
    float bottom_size;
    float width;                            // Widest inserted frame
    std::vector<const FlowNode*> skips;     // Insertions folded in so far
    std::vector<FlowNode*> footnote_spill;          // Entry frames for later regions
    std::vector<const FlowNode*> footnote_queue;    // Notes nested in placed entries

    Insertions() : footnote_separator(nullptr), top_size(0), bottom_size(0), width(0) {}

    void push_float(const PlacedChild* placed, FlowNode* frame, Align align_y);
    void push_footnote(const Config& config, FlowNode* frame);
    void push_footnote_separator(const Config& config, FlowNode* frame);

    // Space taken away from the content
    float height() const { return top_size + bottom_size; }

    // Stack top floats, the content, bottom floats, the separator and the
    // footnotes into one frame. Folds the skips, the entry spill and the
    // nested notes into the work.
    FlowNode* finalize(Arena* arena, Work& work, const Config& config, FlowNode* inner);
};

// ============================================================================
// Composer
// ============================================================================

struct Composer {
    FlowContext& ctx;
    Work& work;
    const Config& config;
    Size page_base;                 // Base size of the whole region
    int column;                     // Index of the column being composed
    Insertions page_insertions;
    Insertions column_insertions;

    Composer(FlowContext& c, Work& w, const Config& cfg, Size base)
        : ctx(c), work(w), config(cfg), page_base(base), column(0) {}

    // Compose one region
    Stop page(const Regions& regions, FlowNode** out);

    // Handle a float: place it into an insertion area (raising a relayout),
    // queue it, or skip it if it was already placed.
    Stop place_float(const PlacedChild* placed, const Regions& regions, bool clearance,
                     bool migratable);

    // Handle the footnote markers in a frame that is about to be placed.
    // `flow_need` is the height the frame takes in the flow.
    Stop footnotes(const Regions& regions, const FlowNode* frame, float flow_need,
                   bool breakable, bool migratable);

    // Width of the widest insertion, for sizing non-expanding columns
    float insertion_width() const;

private:
    Stop page_contents(const Regions& regions, FlowNode** out);
    Stop column_layout(const Regions& regions, FlowNode** out);
    Stop column_contents(const Regions& regions, FlowNode** out);
    Stop footnote(const FlowNode* note, Regions* regions, float flow_need, bool migratable,
                  bool queued, bool nested);
    void queue_footnote(const FlowNode* note, bool nested);
    bool footnote_spill(Size base);
    bool separator_frame(Size base, FlowNode** out);
    bool layout_line_numbers(FlowNode* output);
    bool skipped(const FlowNode* key) const;
    bool queued_footnote(const FlowNode* note) const;
};

// Compose the next region of a flow
Stop compose(FlowContext& ctx, Work& work, const Config& config, const Regions& regions,
             FlowNode** out);

// Footnote markers within a frame, in position order
struct FoundMarker {
    float y;
    const FlowNode* note;
};
void find_footnote_markers(const FlowNode* frame, float y_offset, std::vector<FoundMarker>& out);

} // namespace quire

#endif // QUIRE_FLOW_COMPOSE_HPP
